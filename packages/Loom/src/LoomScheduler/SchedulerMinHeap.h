#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace loom {

/**
 * Node interface for SchedulerMinHeap
 * Must provide id and sortIndex for comparison
 */
struct HeapNode {
  std::uint64_t id{0};
  double sortIndex{0.0};

  virtual ~HeapNode() = default;
};

/**
 * Min-heap of non-owned nodes.
 *
 * - Primary comparison by sortIndex (expiration time for ready tasks,
 *   start time for delayed tasks)
 * - Secondary comparison by id (insertion order for FIFO within same priority)
 * - Standard binary heap with array-based storage
 */
template<typename T>
class SchedulerMinHeap {
private:
  std::vector<T*> heap_;

  static int compare(const T* a, const T* b) {
    const double diff = a->sortIndex - b->sortIndex;
    if (diff != 0.0) {
      return diff < 0.0 ? -1 : 1;
    }
    return a->id < b->id ? -1 : (a->id > b->id ? 1 : 0);
  }

  void siftUp(T* node, std::size_t index) {
    while (index > 0) {
      const std::size_t parentIndex = (index - 1) >> 1;
      T* parent = heap_[parentIndex];

      if (compare(parent, node) > 0) {
        heap_[parentIndex] = node;
        heap_[index] = parent;
        index = parentIndex;
      } else {
        return;
      }
    }
  }

  void siftDown(T* node, std::size_t index) {
    const std::size_t length = heap_.size();
    const std::size_t halfLength = length >> 1;

    while (index < halfLength) {
      const std::size_t leftIndex = (index + 1) * 2 - 1;
      T* left = heap_[leftIndex];
      const std::size_t rightIndex = leftIndex + 1;
      T* right = rightIndex < length ? heap_[rightIndex] : nullptr;

      if (compare(left, node) < 0) {
        if (right != nullptr && compare(right, left) < 0) {
          heap_[index] = right;
          heap_[rightIndex] = node;
          index = rightIndex;
        } else {
          heap_[index] = left;
          heap_[leftIndex] = node;
          index = leftIndex;
        }
      } else if (right != nullptr && compare(right, node) < 0) {
        heap_[index] = right;
        heap_[rightIndex] = node;
        index = rightIndex;
      } else {
        return;
      }
    }
  }

public:
  SchedulerMinHeap() = default;

  // Non-copyable but movable
  SchedulerMinHeap(const SchedulerMinHeap&) = delete;
  SchedulerMinHeap& operator=(const SchedulerMinHeap&) = delete;
  SchedulerMinHeap(SchedulerMinHeap&&) = default;
  SchedulerMinHeap& operator=(SchedulerMinHeap&&) = default;

  void push(T* node) {
    if (node == nullptr) {
      return;
    }

    const std::size_t index = heap_.size();
    heap_.push_back(node);
    siftUp(node, index);
  }

  /**
   * Peek at the minimum element without removing it
   * Returns nullptr if heap is empty
   */
  T* peek() const {
    return heap_.empty() ? nullptr : heap_[0];
  }

  /**
   * Remove and return the minimum element
   * Returns nullptr if heap is empty
   */
  T* pop() {
    if (heap_.empty()) {
      return nullptr;
    }

    T* first = heap_[0];
    T* last = heap_.back();
    heap_.pop_back();

    if (!heap_.empty() && last != first) {
      heap_[0] = last;
      siftDown(last, 0);
    }

    return first;
  }

  bool empty() const {
    return heap_.empty();
  }

  std::size_t size() const {
    return heap_.size();
  }

  void clear() {
    heap_.clear();
  }

  /**
   * Direct access to the underlying array (for debugging and tests)
   */
  const std::vector<T*>& data() const {
    return heap_;
  }
};

} // namespace loom
