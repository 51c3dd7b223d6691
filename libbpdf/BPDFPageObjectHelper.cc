#include <bpdf/BPDFPageObjectHelper.hh>

#include <bpdf/BPDF.hh>
#include <bpdf/BPDFExc.hh>

namespace
{
    class ImageFinder: public BPDFObjectHandle::ParserCallbacks
    {
      public:
        ImageFinder(BPDFObjectHandle xobjects) :
            xobjects(xobjects)
        {
        }
        ~ImageFinder() override = default;

        void
        handleObject(BPDFObjectHandle obj) override
        {
            if (!obj.isOperator()) {
                operands.push_back(obj);
                return;
            }
            auto op = obj.getOperatorValue();
            if (op == "q") {
                stack.push_back(ctm);
            } else if (op == "Q") {
                if (!stack.empty()) {
                    ctm = stack.back();
                    stack.pop_back();
                }
            } else if (op == "cm" && operands.size() == 6) {
                double v[6];
                bool ok = true;
                for (size_t i = 0; i < 6; ++i) {
                    ok = ok && operands.at(i).getValueAsNumber(v[i]);
                }
                if (ok) {
                    ctm.concat(BPDFMatrix(v[0], v[1], v[2], v[3], v[4], v[5]));
                }
            } else if (op == "Do" && operands.size() == 1 && operands.at(0).isName()) {
                auto name = operands.at(0).getName();
                auto xobject = xobjects.getKey(name);
                if (xobject.isImage()) {
                    placements.push_back({name, xobject, ctm});
                }
            }
            operands.clear();
        }

        void
        handleEOF() override
        {
        }

        std::vector<BPDFPageObjectHelper::ImagePlacement> placements;

      private:
        BPDFObjectHandle xobjects;
        std::vector<BPDFObjectHandle> operands;
        BPDFMatrix ctm;
        std::vector<BPDFMatrix> stack;
    };

    bool
    is_inheritable(std::string const& name)
    {
        return name == "MediaBox" || name == "CropBox" || name == "Resources" || name == "Rotate";
    }

    BPDFObjectHandle
    new_content_stream(BPDFObjectHandle const& page, std::string const& data)
    {
        auto* pdf = page.getOwningBPDF();
        if (!pdf) {
            throw std::logic_error("content can only be added to an indirect page object");
        }
        return BPDFObjectHandle::newStream(pdf, data);
    }
} // namespace

BPDFPageObjectHelper::BPDFPageObjectHelper(BPDFObjectHandle oh) :
    BPDFObjectHelper(oh)
{
}

BPDFObjectHandle
BPDFPageObjectHelper::getAttribute(std::string const& name) const
{
    auto node = oh;
    auto result = node.getKey(name);
    if (!is_inheritable(name)) {
        return result;
    }
    BPDFObjGen::set seen;
    while (result.isNull() && node.hasKey("Parent")) {
        if (!seen.add(node.getObjGen())) {
            break;
        }
        node = node.getKey("Parent");
        result = node.getKey(name);
    }
    return result;
}

BPDFObjectHandle::Rectangle
BPDFPageObjectHelper::getMediaBox() const
{
    auto box = getAttribute("MediaBox");
    if (box.isRectangle()) {
        return box.getArrayAsRectangle();
    }
    return {0, 0, 612, 792};
}

BPDFObjectHandle::Rectangle
BPDFPageObjectHelper::getCropBox() const
{
    auto box = getAttribute("CropBox");
    if (box.isRectangle()) {
        return box.getArrayAsRectangle();
    }
    return getMediaBox();
}

int
BPDFPageObjectHelper::getRotation() const
{
    auto rotate = getAttribute("Rotate");
    if (!rotate.isInteger()) {
        return 0;
    }
    long long angle = rotate.getIntValue() % 360;
    if (angle < 0) {
        angle += 360;
    }
    if (angle % 90 != 0) {
        return 0;
    }
    return static_cast<int>(angle);
}

void
BPDFPageObjectHelper::rotatePage(int angle, bool relative)
{
    if (angle % 90 != 0) {
        throw BPDFExc(
            bpdf_e_invalid_angle,
            "",
            "page object " + oh.getObjGen().unparse(),
            0,
            "rotation angle " + std::to_string(angle) + " is not a multiple of 90");
    }
    int new_angle = angle;
    if (relative) {
        new_angle += getRotation();
    }
    new_angle %= 360;
    if (new_angle < 0) {
        new_angle += 360;
    }
    oh.replaceKey("Rotate", BPDFObjectHandle::newInteger(new_angle));
}

BPDFObjectHandle
BPDFPageObjectHelper::getResources()
{
    auto resources = getAttribute("Resources");
    if (!resources.isDictionary()) {
        resources = BPDFObjectHandle::newDictionary();
    } else if (resources.isIndirect() || !oh.hasKey("Resources")) {
        resources = resources.shallowCopy();
    } else {
        return resources;
    }
    oh.replaceKey("Resources", resources);
    return resources;
}

std::string
BPDFPageObjectHelper::addResource(
    std::string const& type, std::string const& prefix, BPDFObjectHandle resource)
{
    auto resources = getResources();
    int suffix = 1;
    auto name = resources.getUniqueResourceName(prefix, suffix);
    auto subdict = resources.getKey(type);
    if (!subdict.isDictionary()) {
        subdict = BPDFObjectHandle::newDictionary();
    } else {
        // The subdictionary may be shared with other pages.
        subdict = subdict.shallowCopy();
    }
    subdict.replaceKey(name, resource);
    resources.replaceKey(type, subdict);
    return name;
}

std::map<std::string, BPDFObjectHandle>
BPDFPageObjectHelper::getImages() const
{
    std::map<std::string, BPDFObjectHandle> result;
    auto xobjects = getAttribute("Resources").getKey("XObject");
    if (!xobjects.isDictionary()) {
        return result;
    }
    for (auto const& [key, value]: xobjects.getDictAsMap()) {
        if (value.isImage()) {
            result[key] = value;
        }
    }
    return result;
}

std::vector<BPDFPageObjectHelper::ImagePlacement>
BPDFPageObjectHelper::getImagePlacements() const
{
    ImageFinder finder(getAttribute("Resources").getKey("XObject"));
    parseContents(&finder);
    return finder.placements;
}

std::vector<BPDFObjectHandle>
BPDFPageObjectHelper::getPageContents() const
{
    return oh.getPageContents();
}

void
BPDFPageObjectHelper::addPageContents(BPDFObjectHandle contents, bool first)
{
    oh.addPageContents(contents, first);
}

std::string
BPDFPageObjectHelper::getContentsData() const
{
    std::string result;
    bool need_newline = false;
    for (auto const& stream: getPageContents()) {
        if (need_newline) {
            result += "\n";
        }
        result += stream.getStreamData();
        need_newline = true;
    }
    return result;
}

void
BPDFPageObjectHelper::parseContents(BPDFObjectHandle::ParserCallbacks* callbacks) const
{
    auto contents = oh.getKey("Contents");
    if (contents.isNull()) {
        callbacks->handleEOF();
        return;
    }
    BPDFObjectHandle::parseContentStream(contents, callbacks);
}

void
BPDFPageObjectHelper::addContentFragment(std::string const& content, bool under)
{
    if (!getPageContents().empty()) {
        addPageContents(new_content_stream(oh, "q\n"), true);
        addPageContents(new_content_stream(oh, "\nQ\n"), false);
    }
    addPageContents(new_content_stream(oh, "q\n" + content + "\nQ\n"), under);
}

BPDFPageObjectHelper
BPDFPageObjectHelper::shallowCopyPage() const
{
    auto* pdf = oh.getOwningBPDF();
    if (!pdf) {
        throw std::logic_error("shallowCopyPage called on a direct object");
    }
    return {pdf->makeIndirectObject(oh.shallowCopy())};
}
