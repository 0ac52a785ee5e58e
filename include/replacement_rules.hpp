#pragma once

#include <json/json.h>
#include <string>
#include <vector>

namespace voxbridge {

// Text substitution the worker applies to each transcript
struct ReplacementRule {
    std::string id;
    std::string kind = "literal";   // "literal" or "regex"
    std::string pattern;
    std::string replacement;
    bool enabled = true;
    bool word_boundary = true;
    bool case_sensitive = false;

    Json::Value to_json() const;
};

class ReplacementRuleLoader {
public:
    // Load rules from ~/.voxbridge/replacements.txt
    static std::vector<ReplacementRule> load_user_rules();

    // One rule per line:
    //   pattern => replacement
    //   re:pattern => replacement     (regular expression)
    //   =pattern => replacement       (case sensitive, no word boundary)
    // Lines starting with '#' are comments. Invalid lines are skipped.
    static std::vector<ReplacementRule> load_from_file(const std::string& path);
    static std::vector<ReplacementRule> parse(const std::string& text);

    // Params for replacements.set_rules
    static Json::Value to_params(const std::vector<ReplacementRule>& rules);

    static std::string get_default_rules_path();

    // Create an example file if none exists
    static bool create_default_rules_file();
};

} // namespace voxbridge
