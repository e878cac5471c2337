#pragma once

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <vector>

namespace inventory::application {

/**
 * @brief Индексы позиций в порядке productId
 *
 * Строки остатков и слоёв трогаются в том же порядке, что и в
 * lockForUpdate, поэтому две многопозиционные операции не встают в deadlock.
 * Результаты кладутся обратно по исходному индексу.
 */
template <typename Item>
std::vector<size_t> indicesByProduct(const std::vector<Item>& items) {
    std::vector<size_t> order(items.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(), [&items](size_t a, size_t b) {
        return items[a].productId < items[b].productId;
    });
    return order;
}

} // namespace inventory::application
