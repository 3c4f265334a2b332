#include "actiongraph/dump_options.h"
#include <stdexcept>
#include <string>

namespace actiongraph {

OutputFormat parseOutputFormat(std::string_view name) {
    if (name == "proto") return OutputFormat::Proto;
    if (name == "textproto") return OutputFormat::TextProto;
    if (name == "jsonproto") return OutputFormat::JsonProto;
    throw std::invalid_argument("unknown output format '" + std::string(name) +
                                "' (expected proto, textproto or jsonproto)");
}

std::string_view outputFormatName(OutputFormat format) {
    switch (format) {
        case OutputFormat::Proto: return "proto";
        case OutputFormat::TextProto: return "textproto";
        case OutputFormat::JsonProto: return "jsonproto";
    }
    return "unknown";
}

} // namespace actiongraph
