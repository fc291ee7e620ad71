#include "generator/slug_generator.hpp"

#include <cctype>

#include "utils/logger.hpp"

namespace minter {
SlugGenerator::SlugGenerator(SlugChecks checks)
    : checks_(std::move(checks))
{
}

void SlugGenerator::setChecks(SlugChecks checks)
{
    checks_ = std::move(checks);
}

std::string SlugGenerator::slug(const std::string &title, const std::string &context,
                                const std::string &type) const
{
    const auto base = sanitizeTitle(title);

    std::function<bool(const std::string &)> exists;
    std::string separator;
    if (context == "post" && checks_.postExists) {
        exists = [this, &type](const std::string &s) { return checks_.postExists(s, type); };
        separator = "-";
    }
    else if (context == "term" && checks_.termExists) {
        exists = [this, &type](const std::string &s) { return checks_.termExists(s, type); };
        separator = "-";
    }
    else if (context == "user" && checks_.userExists) {
        exists = checks_.userExists;
    }
    else {
        return base;
    }

    auto candidate = base;
    for (size_t counter = 1; exists(candidate); counter++) {
        candidate = base + separator + std::to_string(counter);
    }

    if (candidate != base) {
        LOG_DEBUG << "Slug " << base << " занят, выбран " << candidate;
    }
    return candidate;
}

std::string SlugGenerator::sanitizeTitle(const std::string &title)
{
    std::string result;
    result.reserve(title.size());
    bool pendingDash = false;

    for (const auto symbol : title) {
        const auto c = static_cast<unsigned char>(symbol);
        if (std::isspace(c) || symbol == '-') {
            pendingDash = true;
            continue;
        }

        const auto lower = static_cast<char>(std::tolower(c));
        const bool allowed = (lower >= 'a' && lower <= 'z') || (lower >= '0' && lower <= '9')
            || lower == '_';
        if (!allowed) {
            continue;
        }

        // Серии пробелов и дефисов схлопываются, в начале строки дефис не ставится
        if (pendingDash && !result.empty()) {
            result.push_back('-');
        }
        pendingDash = false;
        result.push_back(lower);
    }
    return result;
}
} // namespace minter
