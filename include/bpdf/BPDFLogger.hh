// Copyright (c) 2024-2026 The bpdf authors
//
// This file is part of bpdf.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef BPDFLOGGER_HH
#define BPDFLOGGER_HH

#include <bpdf/DLL.h>
#include <bpdf/Pipeline.hh>

#include <iosfwd>
#include <memory>
#include <mutex>
#include <string_view>

// Routes diagnostic text to pipelines. There are three channels. Info defaults to standard
// output and error to standard error. Warn has no destination of its own by default and follows
// whatever error is routed to. One logger is shared by all batch workers, so each message is
// written under a lock and never interleaves with another.
class BPDFLogger
{
  public:
    enum channel_e { ch_info, ch_warn, ch_error };

    BPDF_DLL
    static std::shared_ptr<BPDFLogger> create();
    BPDF_DLL
    static std::shared_ptr<BPDFLogger> defaultLogger();

    BPDF_DLL
    void info(std::string_view);
    BPDF_DLL
    void warn(std::string_view);
    BPDF_DLL
    void error(std::string_view);

    // Written to the info channel only after setVerbose(true)
    BPDF_DLL
    void verbose(std::string_view);
    BPDF_DLL
    void setVerbose(bool);
    BPDF_DLL
    bool isVerbose() const;

    // A null pipeline restores the channel's default.
    BPDF_DLL
    void route(channel_e, std::shared_ptr<Pipeline>);
    BPDF_DLL
    std::shared_ptr<Pipeline> destination(channel_e) const;

    // Send info to out and error to err, with warn following error. Either may be null to
    // keep the standard stream.
    BPDF_DLL
    void setOutputStreams(std::ostream* out, std::ostream* err);

    BPDF_DLL
    std::shared_ptr<Pipeline> standardOutput() const;
    BPDF_DLL
    std::shared_ptr<Pipeline> standardError() const;
    // A pipeline that drops everything, for silencing a channel
    BPDF_DLL
    static std::shared_ptr<Pipeline> discard();

  private:
    BPDFLogger();
    std::shared_ptr<Pipeline> resolve(channel_e) const;
    void emit(channel_e, std::string_view);

    mutable std::mutex lock;
    bool verbose_output{false};
    std::shared_ptr<Pipeline> std_out;
    std::shared_ptr<Pipeline> std_err;
    std::shared_ptr<Pipeline> routes[3];
};

#endif // BPDFLOGGER_HH
