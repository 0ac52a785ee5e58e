#include "replacement_rules.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <regex>
#include <filesystem>
#include <cstdlib>

namespace voxbridge {

Json::Value ReplacementRule::to_json() const {
    Json::Value out(Json::objectValue);
    out["id"] = id;
    out["kind"] = kind;
    out["pattern"] = pattern;
    out["replacement"] = replacement;
    out["enabled"] = enabled;
    out["word_boundary"] = word_boundary;
    out["case_sensitive"] = case_sensitive;
    return out;
}

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string ReplacementRuleLoader::get_default_rules_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.voxbridge/replacements.txt";
}

std::vector<ReplacementRule> ReplacementRuleLoader::load_user_rules() {
    return load_from_file(get_default_rules_path());
}

std::vector<ReplacementRule> ReplacementRuleLoader::load_from_file(const std::string& path) {
    if (path.empty()) return {};

    std::ifstream file(path);
    if (!file.is_open()) {
        // No rules file is fine
        return {};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::vector<ReplacementRule> rules = parse(buffer.str());
    std::cout << "Loaded " << rules.size() << " replacement rule(s) from " << path << std::endl;
    return rules;
}

std::vector<ReplacementRule> ReplacementRuleLoader::parse(const std::string& text) {
    std::vector<ReplacementRule> rules;
    std::istringstream in(text);
    std::string line;
    int line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t arrow = line.find("=>");
        if (arrow == std::string::npos) {
            std::cerr << "replacements:" << line_no << ": expected 'pattern => replacement'" << std::endl;
            continue;
        }

        ReplacementRule rule;
        rule.id = "rule-" + std::to_string(line_no);
        rule.pattern = trim(line.substr(0, arrow));
        rule.replacement = trim(line.substr(arrow + 2));

        if (rule.pattern.compare(0, 3, "re:") == 0) {
            rule.kind = "regex";
            rule.word_boundary = false;
            rule.pattern = trim(rule.pattern.substr(3));
        } else if (!rule.pattern.empty() && rule.pattern[0] == '=') {
            rule.case_sensitive = true;
            rule.word_boundary = false;
            rule.pattern = trim(rule.pattern.substr(1));
        }

        if (rule.pattern.empty()) {
            std::cerr << "replacements:" << line_no << ": empty pattern" << std::endl;
            continue;
        }

        if (rule.kind == "regex") {
            // Reject here rather than have the worker refuse the whole set
            try {
                std::regex check(rule.pattern, std::regex::ECMAScript);
            } catch (const std::regex_error& e) {
                std::cerr << "replacements:" << line_no << ": invalid regex: " << e.what() << std::endl;
                continue;
            }
        }

        rules.push_back(rule);
    }
    return rules;
}

Json::Value ReplacementRuleLoader::to_params(const std::vector<ReplacementRule>& rules) {
    Json::Value params(Json::objectValue);
    Json::Value list(Json::arrayValue);
    for (const auto& rule : rules) {
        list.append(rule.to_json());
    }
    params["rules"] = list;
    return params;
}

bool ReplacementRuleLoader::create_default_rules_file() {
    std::string path = get_default_rules_path();
    if (path.empty()) return false;

    std::filesystem::path dir = std::filesystem::path(path).parent_path();
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        std::cerr << "Failed to create rules directory: " << ec.message() << std::endl;
        return false;
    }

    // Don't overwrite existing file
    if (std::filesystem::exists(path, ec)) {
        return true;
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "Failed to create rules file: " << path << std::endl;
        return false;
    }

    file << R"(# voxbridge replacement rules
# Applied by the speech worker to every transcript, top to bottom.
#
#   pattern => replacement        whole words, any case
#   =pattern => replacement       exact case, anywhere
#   re:pattern => replacement     regular expression
#
# Examples:
# btw => by the way
# =teh => the
# re:\bcolon\b => :
)";
    return true;
}

} // namespace voxbridge
