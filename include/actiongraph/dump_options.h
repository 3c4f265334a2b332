#pragma once

#include <string>
#include <string_view>

namespace actiongraph {

enum class OutputFormat {
    Proto,
    TextProto,
    JsonProto,
};

/// "proto", "textproto" or "jsonproto". Throws std::invalid_argument otherwise.
OutputFormat parseOutputFormat(std::string_view name);
std::string_view outputFormatName(OutputFormat format);

struct DumpOptions {
    OutputFormat outputFormat = OutputFormat::Proto;
    bool includeCommandline = true;
    bool includeEnvironment = true;
    // ECMAScript regex matched against the whole mnemonic; empty keeps all actions.
    std::string mnemonicFilter;
};

} // namespace actiongraph
