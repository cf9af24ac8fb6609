#pragma once

#include <atomic>
#include <memory>
#include <utility>

namespace lifecore {

// Single-slot cell holding an immutable value behind shared_ptr<const T>.
// Readers copy out the current pointer without locking; a writer replaces
// it in one atomic store. Old values live until their last reader lets go.
template <typename T>
class snapshot_cell {
public:
    snapshot_cell() = default;
    explicit snapshot_cell(std::shared_ptr<const T> initial)
        : m_value(std::move(initial)) {}

    snapshot_cell(const snapshot_cell&) = delete;
    snapshot_cell& operator=(const snapshot_cell&) = delete;

    std::shared_ptr<const T> load() const {
        return std::atomic_load(&m_value);
    }

    void store(std::shared_ptr<const T> value) {
        std::atomic_store(&m_value, std::move(value));
    }

private:
    std::shared_ptr<const T> m_value;
};

} // namespace lifecore
