/*
 * @FileName   : utils.hpp
 * @CreateAt   : 2026/9/20
 * @Description: utils collections
 */

#ifndef QUINT_UTILS_HPP
#define QUINT_UTILS_HPP

#include <tuple>
#include <chrono>
#include <string>
#include <fstream>
#include <sstream>
#include <limits>
#include <utility>
#include <optional>
#include <stdexcept>

namespace quint {

/* timing function, returns (result, elapsed milliseconds) */
template<typename Function, typename... Types>
decltype(auto) timeit(Function &&function, Types &&...args) {
    auto start_time = std::chrono::high_resolution_clock::now();
    auto ret = function(std::forward<Types>(args)...);
    auto stop_time = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double, std::milli> diff = stop_time - start_time;
    return std::make_tuple(std::move(ret), diff.count());
}

/* elapsed milliseconds of a call returning nothing */
template<typename Function, typename... Types>
double timeitVoid(Function &&function, Types &&...args) {
    auto start_time = std::chrono::high_resolution_clock::now();
    function(std::forward<Types>(args)...);
    auto stop_time = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double, std::milli> diff = stop_time - start_time;
    return diff.count();
}

/*
 * rows a store has to return so that `limit` solutions remain after skipping `offset`,
 * nullopt when there is no limit or the sum does not fit
 */
inline std::optional<size_t> rowsToFetch(const std::optional<size_t> &limit, const std::optional<size_t> &offset) {
    if (!limit) return std::nullopt;
    size_t skip = offset.value_or(0);
    if (*limit > std::numeric_limits<size_t>::max() - skip) return std::nullopt;
    return *limit + skip;
}

/* whole file content, throws std::runtime_error when it cannot be opened */
inline std::string readFile(const std::string &filepath) {
    std::ifstream infile(filepath, std::ios::in | std::ios::binary);
    if (!infile.is_open()) {
        throw std::runtime_error("cannot open file: " + filepath);
    }
    std::ostringstream buf;
    buf << infile.rdbuf();
    return buf.str();
}

} // namespace quint

#endif //QUINT_UTILS_HPP
