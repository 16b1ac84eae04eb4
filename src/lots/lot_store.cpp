#include "perfbook/lots/lot_store.hpp"

namespace perfbook {
namespace lots {

void LotStore::replace_all(int taxpayer_id, LotBook book)
{
    std::lock_guard<std::mutex> lock(mutex_);
    books_[taxpayer_id] = std::move(book);
}

std::optional<LotBook> LotStore::book(int taxpayer_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = books_.find(taxpayer_id);
    if (it == books_.end())
        return std::nullopt;
    return it->second;
}

std::mutex& LotStore::rebuild_mutex(int taxpayer_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = rebuild_locks_[taxpayer_id];
    if (!slot)
        slot = std::make_unique<std::mutex>();
    return *slot;
}

} // namespace lots
} // namespace perfbook
