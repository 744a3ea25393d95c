#pragma once

#include "util/noncopyable.hpp"

#include <cstddef>

template <typename T> struct IntrusiveNode {
  IntrusiveNode *next_ = nullptr;

  T *Item() { return static_cast<T *>(this); }
};

// Singly linked FIFO over nodes owned elsewhere
template <typename T> class IntrusiveList : private NonCopyable {
public:
  using Node = IntrusiveNode<T>;

  IntrusiveList() = default;

  IntrusiveList(IntrusiveList &&other) noexcept { Steal(other); }

  IntrusiveList &operator=(IntrusiveList &&other) noexcept {
    if (this != &other) {
      Steal(other);
    }
    return *this;
  }

  void PushBack(Node *node) {
    node->next_ = nullptr;
    if (Empty()) {
      head_ = node;
    } else {
      tail_->next_ = node;
    }
    tail_ = node;
    ++size_;
  }

  T *PopFront() {
    if (Empty()) {
      return nullptr;
    }

    auto *current_head = head_;
    head_ = head_->next_;
    if (head_ == nullptr) {
      tail_ = nullptr;
    }
    current_head->next_ = nullptr;
    --size_;

    return current_head->Item();
  }

  bool Empty() const { return head_ == nullptr; }

  size_t Size() const { return size_; }

private:
  Node *head_{nullptr};
  Node *tail_{nullptr};
  size_t size_{0};

  void Steal(IntrusiveList &other) {
    head_ = other.head_;
    tail_ = other.tail_;
    size_ = other.size_;
    other.head_ = nullptr;
    other.tail_ = nullptr;
    other.size_ = 0;
  }
};
