#include "testid/core/env_flag.hpp"
#include "testid/unique_id.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using testid::Segment;
using testid::UniqueId;

namespace {
struct Args {
    std::vector<std::string> inputs;
    std::vector<Segment> appends;
    bool from_stdin{false};
    bool json{false};
};

std::optional<std::string> eat(std::string_view a, std::string_view key) {
    if (a.rfind(key, 0) == 0) return std::string(a.substr(key.size()));
    return std::nullopt;
}

void print_usage() {
    std::cout << "testid inspector\n"
              << "Usage: testid_inspect [--stdin] [--json] [--append=type:value]... [unique-id]...\n"
              << "  --stdin               read one unique id per line from standard input\n"
              << "  --json                print one JSON object per unique id\n"
              << "  --append=type:value   append a segment (split at the first ':') before printing\n"
              << "Environment: TESTID_INSPECT_DEBUG=1 prints diagnostics to stderr\n";
}

std::string json_quote(std::string_view s) {
    std::string out = "\"";
    for (unsigned char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    out += "\\u00";
                    out += hex[c >> 4];
                    out += hex[c & 0xF];
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    out += '"';
    return out;
}

void print_text(const UniqueId& id) {
    std::cout << id.to_string() << "\n";
    if (auto engine = id.engine_id()) std::cout << "  engine: " << *engine << "\n";
    for (std::size_t i = 0; i < id.size(); ++i) {
        const auto& s = id.segment(i);
        std::cout << "  [" << i << "] " << s.type() << " = " << s.value() << "\n";
    }
}

void print_json(const UniqueId& id) {
    std::cout << "{\"unique_id\":" << json_quote(id.to_string()) << ",\"engine\":";
    if (auto engine = id.engine_id()) std::cout << json_quote(*engine); else std::cout << "null";
    std::cout << ",\"segments\":[";
    for (std::size_t i = 0; i < id.size(); ++i) {
        const auto& s = id.segment(i);
        if (i) std::cout << ",";
        std::cout << "{\"type\":" << json_quote(s.type()) << ",\"value\":" << json_quote(s.value()) << "}";
    }
    std::cout << "]}\n";
}

// Returns false when the input does not parse or an append is rejected.
bool inspect(const std::string& text, const Args& args, bool dbg) {
    auto parsed = UniqueId::parse(text);
    if (!parsed) {
        std::cerr << "error: " << parsed.error().message << "\n";
        return false;
    }
    UniqueId id = std::move(*parsed);
    if (dbg) std::cerr << "[inspect] parsed " << id.size() << " segment(s) from \"" << text << "\"\n";
    for (const auto& s : args.appends) {
        auto next = id.append(s);
        if (!next) {
            std::cerr << "error: " << next.error().message << "\n";
            return false;
        }
        id = std::move(*next);
    }
    if (dbg && id.to_string() != text) std::cerr << "[inspect] rendered as \"" << id.to_string() << "\"\n";
    if (args.json) print_json(id); else print_text(id);
    return true;
}
} // namespace

int main(int argc, char** argv) {
    const bool dbg = testid::core::env_flag_enabled("TESTID_INSPECT_DEBUG");
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--help" || a == "-h") { print_usage(); return 0; }
        if (a == "--stdin") { args.from_stdin = true; continue; }
        if (a == "--json") { args.json = true; continue; }
        if (auto v = eat(a, "--append=")) {
            const auto colon = v->find(':');
            if (colon == std::string::npos) {
                std::cerr << "error: --append expects type:value, got \"" << *v << "\"\n";
                return 2;
            }
            args.appends.emplace_back(v->substr(0, colon), v->substr(colon + 1));
            continue;
        }
        if (a.rfind("--", 0) == 0) {
            std::cerr << "error: unknown option " << a << "\n";
            print_usage();
            return 2;
        }
        args.inputs.push_back(std::move(a));
    }
    if (args.inputs.empty() && !args.from_stdin) { print_usage(); return 2; }

    bool all_ok = true;
    for (const auto& in : args.inputs) all_ok = inspect(in, args, dbg) && all_ok;
    if (args.from_stdin) {
        std::string line;
        std::size_t line_no = 0;
        while (std::getline(std::cin, line)) {
            ++line_no;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty()) continue;
            if (dbg) std::cerr << "[inspect] stdin line " << line_no << "\n";
            all_ok = inspect(line, args, dbg) && all_ok;
        }
    }
    return all_ok ? 0 : 1;
}
