#include <finl/config.hpp>
#include <finl/lang/parser.hpp>
#include <finl/log.hpp>
#include <fstream>
#include <iostream>
#include <memory>

using namespace finl;

static void print_token(const Token& t, int depth) {
    std::string indent(depth * 2, ' ');
    std::cout << indent << t.loc.line << ":" << t.loc.column + 1
              << "  " << token_kind_name(t.kind);

    switch (t.kind) {
    case TokenKind::ParsedText:
    case TokenKind::RawText:
    case TokenKind::Math:
        std::cout << "  \"" << t.text << "\"\n";
        return;
    case TokenKind::Boolean:
        std::cout << "  " << (t.flag ? "true" : "false") << "\n";
        return;
    case TokenKind::KeyValueList:
        std::cout << "\n";
        for (auto& [k, v] : t.pairs) {
            std::cout << indent << "    " << k;
            if (!v.empty()) std::cout << " = " << v;
            std::cout << "\n";
        }
        return;
    case TokenKind::Command:
    case TokenKind::Environment:
        std::cout << "  " << t.name() << "\n";
        break;
    default:
        std::cout << "\n";
        break;
    }

    for (auto& c : t.children) print_token(c, depth + 1);
    if (!t.body.empty()) {
        std::cout << indent << "  body:\n";
        for (auto& b : t.body) print_token(b, depth + 2);
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: finl-dump <file.tex> [--config <file.toml>] [--verbose]\n";
        return 1;
    }

    std::string path = argv[1];
    std::string config_path;
    bool verbose = false;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            std::cerr << "error: unknown option " << arg << "\n";
            return 1;
        }
    }

    Config cfg;
    if (!config_path.empty()) {
        auto cr = Config::load(config_path);
        if (cr.is_err()) {
            std::cerr << cr.error().format() << "\n";
            return 1;
        }
        cfg = std::move(cr).value();
    }
    cfg.apply_logging();
    if (verbose) log::set_level(log::Debug);

    auto in = std::make_unique<std::ifstream>(path);
    if (!in->is_open()) {
        std::cerr << "error: cannot open " << path << "\n";
        return 1;
    }

    auto parser = Parser::from_source(std::make_unique<StreamLineSource>(std::move(in)),
                                      path, cfg.parser);
    auto applied = cfg.apply(parser);
    if (applied.is_err()) {
        std::cerr << applied.error().format() << "\n";
        return 1;
    }

    auto items = parser.parse();

    size_t errors = 0;
    std::cout << "--- " << path << " ---\n";
    for (auto& item : items) {
        if (item.result.is_ok()) {
            print_token(item.result.value(), 0);
        } else {
            ++errors;
            std::cerr << item.result.error().format() << "\n\n";
        }
    }
    std::cout << "Items: " << items.size() << "  Errors: " << errors << "\n";

    return errors == 0 ? 0 : 2;
}
