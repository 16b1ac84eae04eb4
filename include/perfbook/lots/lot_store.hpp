#pragma once

#include "perfbook/lots/tax_lot.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace perfbook {
namespace lots {

/**
 * @class LotStore
 * @brief Holds the reconstructed lot book of every taxpayer.
 *
 * A rebuild never edits a stored book in place. It computes a new LotBook
 * aside and hands it to replace_all(), which swaps it in as one unit, so
 * readers see either the old book or the new one. If the rebuild throws
 * before replace_all() the previous book stays.
 *
 * Rebuilds for the same taxpayer must hold rebuild_mutex(taxpayer_id).
 */
class LotStore {
public:
    LotStore() = default;
    ~LotStore() = default;

    LotStore(const LotStore&) = delete;
    LotStore& operator=(const LotStore&) = delete;

    /// Replace (adjustments, disposals, lots) of one taxpayer in a single swap.
    void replace_all(int taxpayer_id, LotBook book);

    /// Copy of the current book, if the taxpayer was ever rebuilt.
    std::optional<LotBook> book(int taxpayer_id) const;

    /// Per-taxpayer lock serializing rebuilds; created on first use.
    std::mutex& rebuild_mutex(int taxpayer_id);

private:
    mutable std::mutex mutex_;
    std::map<int, LotBook> books_;
    std::map<int, std::unique_ptr<std::mutex>> rebuild_locks_;
};

} // namespace lots
} // namespace perfbook
