#include <bpdf/assert_test.h>

#include "sample_pdf.hh"

#include <bpdf/BPDFExc.hh>
#include <iostream>

typedef std::vector<std::string> texts_t;

static std::string
doc(int npages, std::string const& label, std::string const& title = "Sample")
{
    return write_pdf(*make_sample_pdf(npages, title, label));
}

static std::string
output_data(BPDFOperation::Result const& result, size_t n = 0)
{
    return BPDFOperation::writeOutput(result.outputs.at(n));
}

static bpdf_error_code_e
error_code(
    bpdf_operation_e op,
    std::string const& data,
    std::map<std::string, std::string> const& values)
{
    try {
        run_operation(op, {{"in.pdf", data}}, values);
    } catch (BPDFExc& e) {
        return e.getErrorCode();
    }
    return bpdf_e_success;
}

static void
test_merge()
{
    auto a = doc(2, "A", "First");
    auto b = doc(3, "B", "Second");
    auto c = doc(1, "C", "Third");

    auto ab = output_data(run_operation(bpdf_op_merge, {{"a.pdf", a}, {"b.pdf", b}}));
    auto ab_c = run_operation(bpdf_op_merge, {{"ab.pdf", ab}, {"c.pdf", c}});
    auto bc = output_data(run_operation(bpdf_op_merge, {{"b.pdf", b}, {"c.pdf", c}}));
    auto a_bc = run_operation(bpdf_op_merge, {{"a.pdf", a}, {"bc.pdf", bc}});
    auto abc = run_operation(bpdf_op_merge, {{"a.pdf", a}, {"b.pdf", b}, {"c.pdf", c}});

    texts_t expected = {"A 1", "A 2", "B 1", "B 2", "B 3", "C 1"};
    assert(page_texts(*reread_output(ab_c)) == expected);
    assert(page_texts(*reread_output(a_bc)) == expected);
    assert(page_texts(*reread_output(abc)) == expected);

    // Document information comes from the first input.
    auto merged = reread_output(abc);
    assert(merged->getInfo().getKey("Title").getUTF8Value() == "First");
    assert(!merged->getRoot().hasKey("Outlines"));

    // Merging a document with itself duplicates its pages.
    auto twice = run_operation(bpdf_op_merge, {{"a.pdf", a}, {"a.pdf", a}});
    assert(page_texts(*reread_output(twice)) == texts_t({"A 1", "A 2", "A 1", "A 2"}));

    auto marked = reread_output(
        run_operation(bpdf_op_merge, {{"a.pdf", a}, {"b.pdf", b}}, {{"bookmarks", "yes"}}));
    auto outlines = marked->getRoot().getKey("Outlines");
    assert(outlines.getKey("Count").getIntValue() == 2);
    assert(outlines.getKey("First").getKey("Title").getUTF8Value() == "a.pdf");
    assert(outlines.getKey("Last").getKey("Title").getUTF8Value() == "b.pdf");
    auto dest = outlines.getKey("Last").getKey("Dest").getArrayItem(0);
    assert(marked->findPage(dest) == 2);

    try {
        run_operation(bpdf_op_merge, {});
        assert(false);
    } catch (BPDFExc& e) {
        assert(e.getErrorCode() == bpdf_e_empty_input);
    }
}

static void
test_split()
{
    auto ten = doc(10, "P");
    auto result = run_operation(bpdf_op_split, {{"ten.pdf", ten}}, {{"ranges", "1-3,4-6,7-10"}});
    assert(result.outputs.size() == 3);
    assert(page_texts(*reread_output(result, 0)) == texts_t({"P 1", "P 2", "P 3"}));
    assert(reread_output(result, 2)->getAllPages().size() == 4);

    // Merging the parts restores the original order.
    std::vector<std::pair<std::string, std::string>> parts;
    for (size_t i = 0; i < result.outputs.size(); ++i) {
        parts.emplace_back("part" + std::to_string(i) + ".pdf", output_data(result, i));
    }
    auto rejoined = reread_output(run_operation(bpdf_op_merge, parts));
    assert(page_texts(*rejoined) == page_texts(*read_pdf(ten)));

    auto every = run_operation(bpdf_op_split, {{"ten.pdf", ten}}, {{"every", "4"}});
    assert(every.outputs.size() == 3);
    assert(page_texts(*reread_output(every, 2)) == texts_t({"P 9", "P 10"}));

    auto single = run_operation(bpdf_op_split, {{"ten.pdf", ten}});
    assert(single.outputs.size() == 10);
    assert(page_texts(*reread_output(single, 9)) == texts_t({"P 10"}));

    auto tail = run_operation(bpdf_op_split, {{"ten.pdf", ten}}, {{"ranges", "r2-z"}});
    assert(page_texts(*reread_output(tail)) == texts_t({"P 9", "P 10"}));

    assert(error_code(bpdf_op_split, ten, {{"ranges", "1-3,3-4"}}) == bpdf_e_invalid_range);
    assert(error_code(bpdf_op_split, ten, {{"ranges", "1-11"}}) == bpdf_e_invalid_range);
    assert(error_code(bpdf_op_split, ten, {{"ranges", "1-"}}) == bpdf_e_invalid_range);
    assert(error_code(bpdf_op_split, ten, {{"every", "0"}}) == bpdf_e_invalid_parameter);
}

static void
test_rotate()
{
    auto data = doc(3, "R");
    for (int i = 0; i < 4; ++i) {
        data = output_data(run_operation(bpdf_op_rotate, {{"in.pdf", data}}, {{"angle", "90"}}));
        auto pdf = read_pdf(data);
        for (auto const& page: BPDFPageDocumentHelper(*pdf).getAllPages()) {
            assert(page.getRotation() == ((i + 1) * 90) % 360);
        }
    }

    auto some = run_operation(
        bpdf_op_rotate, {{"in.pdf", data}}, {{"angle", "-90"}, {"pages", "2"}});
    auto some_pdf = reread_output(some);
    auto pages = BPDFPageDocumentHelper(*some_pdf).getAllPages();
    assert(pages.at(0).getRotation() == 0);
    assert(pages.at(1).getRotation() == 270);

    auto absolute = run_operation(
        bpdf_op_rotate, {{"in.pdf", output_data(some)}}, {{"angle", "180"}, {"relative", "false"}});
    auto absolute_pdf = reread_output(absolute);
    for (auto const& page: BPDFPageDocumentHelper(*absolute_pdf).getAllPages()) {
        assert(page.getRotation() == 180);
    }

    assert(error_code(bpdf_op_rotate, data, {{"angle", "45"}}) == bpdf_e_invalid_angle);
    assert(error_code(bpdf_op_rotate, data, {{"pages", "4"}}) == bpdf_e_invalid_range);
}

static void
test_reorder()
{
    auto data = doc(4, "O");
    auto result = run_operation(bpdf_op_reorder, {{"in.pdf", data}}, {{"order", "3,1,4,2"}});
    assert(page_texts(*reread_output(result)) == texts_t({"O 3", "O 1", "O 4", "O 2"}));

    assert(error_code(bpdf_op_reorder, data, {{"order", "1,1,2,3"}}) == bpdf_e_invalid_permutation);
    assert(error_code(bpdf_op_reorder, data, {{"order", "1,2,3"}}) == bpdf_e_invalid_permutation);
    assert(error_code(bpdf_op_reorder, data, {{"order", "1,2,3,5"}}) == bpdf_e_invalid_permutation);
    assert(error_code(bpdf_op_reorder, data, {{"order", "1,2,x,4"}}) == bpdf_e_invalid_permutation);
    assert(error_code(bpdf_op_reorder, data, {}) == bpdf_e_invalid_parameter);
}

int
main()
{
    test_merge();
    test_split();
    test_rotate();
    test_reorder();
    std::cout << "page operation tests done" << std::endl;
    return 0;
}
