#ifndef QUNET_CORE_CONTAINER_HPP
#define QUNET_CORE_CONTAINER_HPP

#include <boost/container/flat_map.hpp>
#include <boost/container/flat_set.hpp>
#include <boost/container/small_vector.hpp>

#include <cstddef>
#include <functional>
#include <vector>

namespace qunet::container {

template <typename T>
using vector = std::vector<T>;

/// for shapes, index lists and tag lists
template <typename T, std::size_t N = 8>
using svector = boost::container::small_vector<T, N>;

/// sorted, contiguous; used for the registries of TensorNetwork
template <typename Key, typename Compare = std::less<Key>>
using set = boost::container::flat_set<Key, Compare>;
template <typename Key, typename Value, typename Compare = std::less<Key>>
using map = boost::container::flat_map<Key, Value, Compare>;

}  // namespace qunet::container

#endif  // QUNET_CORE_CONTAINER_HPP
