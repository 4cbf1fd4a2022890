#pragma once
/**
 * @file label_selector.hpp
 * @brief Cluster label-selector expressions: parse once, match many label sets.
 * @details Grammar (comma joins requirements, whitespace ignored):
 *   key=value | key==value | key!=value | key in (v1,v2) | key notin (v1,v2)
 *   key | !key | key>int | key<int
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "negsync/cluster/objects.hpp"
#include "negsync/core/error.hpp"

namespace negsync::cluster {

/** @enum SelectorOperator
 *  @brief Requirement operator.
 */
enum class SelectorOperator : std::uint8_t {
    Equals,       ///< key=value
    DoubleEquals, ///< key==value
    NotEquals,    ///< key!=value (absent key matches)
    In,           ///< key in (...)
    NotIn,        ///< key notin (...) (absent key matches)
    Exists,       ///< key
    DoesNotExist, ///< !key
    GreaterThan,  ///< key>int
    LessThan      ///< key<int
};

/** @struct SelectorRequirement
 *  @brief One comma-separated term of a selector.
 */
struct SelectorRequirement {
    std::string key;
    SelectorOperator op{SelectorOperator::Exists};
    std::vector<std::string> values;

    /// @return true if @p labels satisfy this term.
    bool matches(const Labels& labels) const;
};

/** @class LabelSelector
 *  @brief Conjunction of requirements. The empty selector matches everything.
 */
class LabelSelector {
public:
    /**
     * @brief Parse a selector expression.
     * @param expr Expression text, e.g. "track=canary,tier in (web,api)".
     * @return ErrorCode::InvalidArgument on syntax or key/value validation errors.
     */
    static Result<LabelSelector> parse(std::string_view expr);

    /// @return true if every requirement holds.
    [[nodiscard]] bool matches(const Labels& labels) const;

    [[nodiscard]] bool empty() const noexcept { return reqs_.empty(); }
    [[nodiscard]] const std::vector<SelectorRequirement>& requirements() const noexcept { return reqs_; }

private:
    std::vector<SelectorRequirement> reqs_;
};

} // namespace negsync::cluster
