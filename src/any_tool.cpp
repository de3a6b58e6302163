// any_tool.cpp  (JSON document <-> serialized google.protobuf.Any envelope)
#include <s2_proto/errors.hpp>
#include <s2_proto/json.hpp>

#include <google/protobuf/any.pb.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>

namespace
{

void usage(const char* argv0)
{
    std::cerr << "usage: " << argv0 << " pack <in.json|-> <out.bin>\n";
    std::cerr << "       " << argv0 << " unpack <in.bin> [--indent <n>]\n";
    std::cerr << "       " << argv0 << " inspect <in.bin>\n";
    std::cerr << "  pack:    wrap a JSON document into an Any (type url '" << s2_proto::kJsonTypeUrl << "')\n";
    std::cerr << "  unpack:  print the JSON carried by an Any\n";
    std::cerr << "  inspect: print type url and payload size without decoding\n";
    std::cerr << "  --indent: pretty-print with n spaces (default: compact)\n";
}

std::optional<std::string> readAll(const std::string& path)
{
    if (path == "-")
    {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::optional<google::protobuf::Any> readAny(const std::string& path)
{
    auto bytes = readAll(path);
    if (!bytes)
    {
        std::cerr << "Failed to open input: " << path << "\n";
        return std::nullopt;
    }
    google::protobuf::Any any;
    if (!any.ParseFromString(*bytes))
    {
        std::cerr << "Input is not a serialized google.protobuf.Any: " << path << "\n";
        return std::nullopt;
    }
    return any;
}

int runPack(const std::string& in_path, const std::string& out_path)
{
    auto text = readAll(in_path);
    if (!text)
    {
        std::cerr << "Failed to open input: " << in_path << "\n";
        return 1;
    }

    nlohmann::json doc;
    try
    {
        doc = nlohmann::json::parse(*text);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        std::cerr << "Invalid JSON in " << in_path << ": " << e.what() << "\n";
        return 2;
    }

    google::protobuf::Any any;
    try
    {
        any = s2_proto::pack<google::protobuf::Any>(std::move(doc));
    }
    catch (const s2_proto::ConversionError& e)
    {
        std::cerr << "pack failed [" << s2_proto::toString(e.kind()) << "]: " << e.what() << "\n";
        return 2;
    }

    std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
    if (!out || !any.SerializeToOstream(&out))
    {
        std::cerr << "Failed to write output: " << out_path << "\n";
        return 1;
    }
    std::cerr << "Wrote " << any.ByteSizeLong() << " bytes to " << out_path << "\n";
    return 0;
}

int runUnpack(const std::string& in_path, int indent)
{
    auto any = readAny(in_path);
    if (!any)
    {
        return 1;
    }

    try
    {
        auto doc = s2_proto::unpack<nlohmann::json>(std::move(*any));
        std::cout << doc.dump(indent) << "\n";
    }
    catch (const s2_proto::ConversionError& e)
    {
        std::cerr << "unpack failed [" << s2_proto::toString(e.kind()) << "]: " << e.what() << "\n";
        return 2;
    }
    return 0;
}

int runInspect(const std::string& in_path)
{
    auto any = readAny(in_path);
    if (!any)
    {
        return 1;
    }

    const bool known = s2_proto::anyFormatForTypeUrl(any->type_url()).has_value();
    std::cout << "type_url: '" << any->type_url() << "'" << (known ? "" : " (unknown)") << "\n";
    std::cout << "payload:  " << any->value().size() << " bytes\n";
    return 0;
}

}  // namespace

int main(int argc, char** argv)
{
    if (argc < 3)
    {
        usage(argv[0]);
        return 1;
    }
    const std::string cmd = argv[1];

    if (cmd == "pack")
    {
        if (argc != 4)
        {
            usage(argv[0]);
            return 1;
        }
        return runPack(argv[2], argv[3]);
    }

    if (cmd == "unpack")
    {
        int indent = -1;
        for (int i = 3; i < argc; i++)
        {
            std::string arg = argv[i];
            if (arg == "--indent" && i + 1 < argc)
            {
                try
                {
                    indent = std::stoi(argv[++i]);
                    if (indent < 0)
                    {
                        std::cerr << "Indent must not be negative\n";
                        return 1;
                    }
                }
                catch (const std::exception&)
                {
                    std::cerr << "Invalid indent: " << argv[i] << " (must be a non-negative integer)\n";
                    return 1;
                }
            }
            else
            {
                std::cerr << "Unknown argument: " << arg << "\n";
                return 1;
            }
        }
        return runUnpack(argv[2], indent);
    }

    if (cmd == "inspect")
    {
        return runInspect(argv[2]);
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    usage(argv[0]);
    return 1;
}
