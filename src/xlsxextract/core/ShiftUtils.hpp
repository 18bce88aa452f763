#pragma once

namespace xlsxextract {
namespace core {

/**
 * @brief 在 at 处插入 count 行/列后平移区间 [first, last]
 *
 * 跨越插入点的区间随之扩大。
 */
inline void shiftIntervalForInsertion(int& first, int& last, int at, int count) {
    if (first >= at) {
        first += count;
    }
    if (last >= at) {
        last += count;
    }
}

/**
 * @brief 删除 [at, at + count) 后平移区间 [first, last]
 * @return 区间整体被删除时返回 false
 */
inline bool shiftIntervalForDeletion(int& first, int& last, int at, int count) {
    const int end = at + count;
    if (first >= end) {
        first -= count;
    } else if (first >= at) {
        first = at;
    }
    if (last >= end) {
        last -= count;
    } else if (last >= at) {
        last = at - 1;
    }
    return first <= last;
}

}} // namespace xlsxextract::core
