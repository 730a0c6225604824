#include "search_spec.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>

namespace {

const std::set<std::string>& query_stop_words() {
    static const std::set<std::string> words = {
        "the", "a", "an", "and", "or", "in", "on", "at", "to", "for", "of", "with", "new", "used"
    };
    return words;
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Whole-word containment, both sides already lower-cased
bool contains_word(const std::string& haystack, const std::string& word) {
    if (word.empty()) return true;
    size_t pos = haystack.find(word);
    while (pos != std::string::npos) {
        bool left_ok = pos == 0 || !is_word_char(haystack[pos - 1]) || !is_word_char(word.front());
        size_t end = pos + word.size();
        bool right_ok = end == haystack.size() || !is_word_char(haystack[end]) || !is_word_char(word.back());
        if (left_ok && right_ok) return true;
        pos = haystack.find(word, pos + 1);
    }
    return false;
}

std::vector<std::string> lowered_list(const nlohmann::json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key)) return out;
    for (const auto& w : j.at(key)) {
        std::string word = util::trim(util::to_lower(w.get<std::string>()));
        if (!word.empty()) out.push_back(word);
    }
    return out;
}

} // namespace

std::optional<ConditionFilter> parse_condition(const std::string& name) {
    std::string key = util::to_lower(util::trim(name));
    if (key.empty() || key == "any") return ConditionFilter::Any;
    if (key == "new") return ConditionFilter::New;
    if (key == "new_open_box") return ConditionFilter::NewOpenBox;
    if (key == "refurbished") return ConditionFilter::Refurbished;
    if (key == "used") return ConditionFilter::Used;
    if (key == "used_good") return ConditionFilter::UsedGood;
    if (key == "any_not_broken") return ConditionFilter::AnyNotBroken;
    return std::nullopt;
}

const char* condition_name(ConditionFilter condition) {
    switch (condition) {
        case ConditionFilter::Any: return "any";
        case ConditionFilter::New: return "new";
        case ConditionFilter::NewOpenBox: return "new_open_box";
        case ConditionFilter::Refurbished: return "refurbished";
        case ConditionFilter::Used: return "used";
        case ConditionFilter::UsedGood: return "used_good";
        case ConditionFilter::AnyNotBroken: return "any_not_broken";
    }
    return "any";
}

std::string condition_filter_ids(ConditionFilter condition) {
    // 1000 new, 1500 open box, 2000/2500 refurbished, 3000-6000 used grades
    switch (condition) {
        case ConditionFilter::Any: return "";
        case ConditionFilter::New: return "{1000}";
        case ConditionFilter::NewOpenBox: return "{1000|1500}";
        case ConditionFilter::Refurbished: return "{2000|2500}";
        case ConditionFilter::Used: return "{3000|4000|5000|6000}";
        case ConditionFilter::UsedGood: return "{3000|4000|5000}";
        case ConditionFilter::AnyNotBroken: return "{1000|1500|2000|2500|3000|4000|5000|6000}";
    }
    return "";
}

double SearchSpec::effective_max_price(bool best_offer) const {
    if (best_offer && has_upper_bound()) {
        return max_price * kBestOfferBuffer;
    }
    return max_price;
}

bool SearchSpec::price_in_band(double price, bool best_offer) const {
    return price >= min_price && price <= effective_max_price(best_offer);
}

std::vector<std::string> SearchSpec::effective_required_words() const {
    if (!required_words.empty()) {
        return required_words;
    }

    std::vector<std::string> words;
    std::string token;
    std::string lowered = util::to_lower(query);
    for (size_t i = 0; i <= lowered.size(); ++i) {
        if (i == lowered.size() || std::isspace(static_cast<unsigned char>(lowered[i]))) {
            bool keep = !token.empty() &&
                        (token.size() > 1 || std::isdigit(static_cast<unsigned char>(token[0]))) &&
                        query_stop_words().count(token) == 0;
            if (keep) words.push_back(token);
            token.clear();
        } else {
            token += lowered[i];
        }
    }
    return words;
}

bool SearchSpec::title_matches(const std::string& title) const {
    std::string lowered = util::to_lower(title);
    for (const auto& word : effective_required_words()) {
        if (!contains_word(lowered, word)) {
            return false;
        }
    }
    return true;
}

bool SearchSpec::title_excluded(const std::string& title) const {
    std::string lowered = util::to_lower(title);
    return std::any_of(exclude_words.begin(), exclude_words.end(),
                       [&](const std::string& w) { return lowered.find(w) != std::string::npos; });
}

std::vector<std::string> SearchSpec::validation_errors() const {
    std::vector<std::string> errors;
    if (name.empty()) errors.push_back("search name is empty");
    if (util::trim(query).empty()) errors.push_back("query is empty");
    if (min_price < 0) errors.push_back("min_price is negative");
    if (min_price > max_price) errors.push_back("min_price exceeds max_price");
    return errors;
}

void from_json(const nlohmann::json& j, SearchSpec& spec) {
    spec.query = j.at("query").get<std::string>();
    spec.name = j.value("name", spec.query);
    spec.min_price = j.value("min_price", 0.0);
    spec.max_price = j.value("max_price", kUnboundedPrice);

    std::string condition = j.value("condition", "any");
    auto parsed = parse_condition(condition);
    if (!parsed) {
        throw std::invalid_argument("unknown condition '" + condition + "' in search '" + spec.name + "'");
    }
    spec.condition = *parsed;

    // Older configs only knew "buy it now only", the inverse flag
    if (j.contains("include_auctions")) {
        spec.include_auctions = j.at("include_auctions").get<bool>();
    } else {
        spec.include_auctions = !j.value("buy_it_now_only", true);
    }
    spec.free_shipping_only = j.value("free_shipping_only", false);
    spec.exclude_words = lowered_list(j, "exclude_words");
    spec.required_words = lowered_list(j, "required_words");
    spec.enabled = j.value("enabled", true);
}
