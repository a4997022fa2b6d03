/*
 * @FileName   : result_set.hpp
 * @CreateAt   : 2026/9/20
 * @Description: Collects the mappings of query variables and their values, one map per solution,
 *               together with the projected variable names in query order.
 */

#ifndef QUINT_RESULT_SET_HPP
#define QUINT_RESULT_SET_HPP

#include <string>
#include <vector>
#include <unordered_map>

#include "common/type.hpp"

namespace quint {

template<typename Key, typename Value>
class ResultSet {
public:
    using key_type = Key;
    using value_type = Value;
    using item_type = std::unordered_map<key_type, value_type>;

public:
    ResultSet() = default;
    explicit ResultSet(std::vector<key_type> variables) : variables_(std::move(variables)) {}

    decltype(auto) begin() { return result_.begin(); }
    decltype(auto) begin() const { return result_.begin(); }
    decltype(auto) end() { return result_.end(); }
    decltype(auto) end() const { return result_.end(); }

    void reserve(const std::size_t &size) {
        result_.reserve(size);
    }

    void push_back(item_type item) {
        result_.push_back(std::move(item));
    }

    void clear() {
        result_.clear();
    }

    std::size_t size() const {
        return result_.size();
    }

    bool empty() const {
        return result_.empty();
    }

    item_type &operator[](size_t index) {
        return result_.at(index);
    }

    const item_type &operator[](size_t index) const {
        return result_.at(index);
    }

    const std::vector<key_type> &variables() const {
        return variables_;
    }

    void setVariables(std::vector<key_type> variables) {
        variables_ = std::move(variables);
    }

    bool operator==(const ResultSet<key_type, value_type> &other) const {
        return variables_ == other.variables_ && result_ == other.result_;
    }

    bool operator!=(const ResultSet<key_type, value_type> &other) const {
        return !(*this == other);
    }

private:
    std::vector<key_type> variables_;
    std::vector<item_type> result_;
};

/* variable name (without '?') -> bound term */
using Binding = std::unordered_map<std::string, Term>;
using SolutionSet = ResultSet<std::string, Term>;

} // namespace quint

#endif //QUINT_RESULT_SET_HPP
