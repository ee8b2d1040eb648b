// =============================================================================
// docrecon - Common Type Definitions Implementation
// =============================================================================

#include "docrecon/common/types.h"

#include <cctype>
#include <string>

namespace docrecon {

namespace {

/// @brief Lowercase a label and fold spaces and hyphens to underscores.
std::string normalizeLabel(std::string_view label) {
    std::string out;
    out.reserve(label.size());

    // Trim surrounding whitespace
    std::size_t begin = 0;
    std::size_t end = label.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(label[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(label[end - 1]))) {
        --end;
    }

    for (std::size_t i = begin; i < end; ++i) {
        const auto c = static_cast<unsigned char>(label[i]);
        if (c == ' ' || c == '-' || c == '_') {
            if (out.empty() || out.back() != '_') {
                out.push_back('_');
            }
        } else {
            out.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    return out;
}

}  // namespace

std::optional<ElementClass> parseElementClass(std::string_view label) noexcept {
    const std::string normalized = normalizeLabel(label);
    if (normalized.empty()) {
        return std::nullopt;
    }

    for (std::size_t i = 0; i < kElementClassCount; ++i) {
        const auto cls = static_cast<ElementClass>(i);
        if (elementClassToString(cls) == normalized) {
            return cls;
        }
    }

    // Aliases seen in detector exports
    if (normalized == "choice") {
        return ElementClass::kChoices;
    }
    if (normalized == "section_unit") {
        return ElementClass::kUnit;
    }
    if (normalized == "sub_question_number") {
        return ElementClass::kSecondQuestionNumber;
    }
    return std::nullopt;
}

ElementClass elementClassFromLabel(std::string_view label) noexcept {
    return parseElementClass(label).value_or(ElementClass::kUnknown);
}

std::optional<DocumentMode> parseDocumentMode(std::string_view name) noexcept {
    const std::string normalized = normalizeLabel(name);
    if (normalized == "question_based" || normalized == "worksheet") {
        return DocumentMode::kQuestionBased;
    }
    if (normalized == "reading_order") {
        return DocumentMode::kReadingOrder;
    }
    return std::nullopt;
}

std::optional<StrategyKind> parseStrategyKind(std::string_view name) noexcept {
    const std::string normalized = normalizeLabel(name);
    if (normalized == "direct" || normalized == "global_first") {
        return StrategyKind::kDirect;
    }
    if (normalized == "legacy_local" || normalized == "local_first" || normalized == "local") {
        return StrategyKind::kLegacyLocal;
    }
    if (normalized == "hybrid") {
        return StrategyKind::kHybrid;
    }
    return std::nullopt;
}

}  // namespace docrecon
