#include <cxxopts.hpp>
#include <iostream>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include "pathflat/Flatten.hpp"
#include "pathflat/Loader.hpp"
#include "pathflat/Options.hpp"
#include "pathflat/Errors.hpp"

using namespace pathflat;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("pathflat", "Flatten a JSON/TOML document into a path -> value update map");
        options.positional_help("[FILE]");

        options.add_options()
            ("c,config", "Options file (JSON/TOML)", cxxopts::value<std::string>())
            ("r,root", "Path prefix for every key, e.g. /users", cxxopts::value<std::string>())
            ("skip-empty", "Omit null values and empty/whitespace strings")
            ("keys", "Policy for keys containing '/': reject|escape|verbatim", cxxopts::value<std::string>())
            ("indent", "Output indentation (-1 for compact)", cxxopts::value<int>())
            ("o,out", "Write output to FILE instead of stdout", cxxopts::value<std::string>())
            ("h,help", "Show help");

        options.add_options()
            ("input", "Document to flatten (.json/.toml, '-' for JSON on stdin)", cxxopts::value<std::string>());

        options.parse_positional({"input"});

        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        // defaults -> options file -> flags
        ToolOptions tool;
        if (result.count("config")) {
            tool = load_options_file(result["config"].as<std::string>(), tool);
        }
        // Flags go through the same checks as the options file
        Value flags = Value::object();
        if (result.count("root")) flags["root"] = result["root"].as<std::string>();
        if (result.count("skip-empty")) flags["include_null_and_empty"] = false;
        if (result.count("keys")) flags["key_policy"] = result["keys"].as<std::string>();
        if (result.count("indent")) flags["indent"] = result["indent"].as<int>();
        apply_options(tool, flags);

        std::string input = result.count("input") ? result["input"].as<std::string>() : "-";
        Value doc;
        if (input == "-") {
            std::string text((std::istreambuf_iterator<char>(std::cin)),
                             std::istreambuf_iterator<char>());
            doc = parse_document(text, DocumentFormat::Json, "<stdin>");
        } else {
            doc = load_document(input);
        }

        const auto body = to_update_object(flatten(doc, tool.flatten));
        const std::string text = body.dump(tool.indent);

        if (result.count("out")) {
            const auto out = result["out"].as<std::string>();
            std::ofstream ofs(out);
            if (!ofs) {
                std::cerr << "Error: cannot write to " << out << "\n";
                return 1;
            }
            ofs << text << "\n";
        } else {
            std::cout << text << "\n";
        }
        return 0;

    } catch (const FlattenError& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
