#include <chklib/lang/operations.hh>
#include <chklib/lang/value.hh>

namespace chk::lang {

std::optional<size_t> OrderedTable::find(const Value& key) const {
    size_t hash = hash_value(key);
    auto [beg, end] = index_.equal_range(hash);
    for (auto it = beg; it != end; ++it) {
        const auto& entry = entries_[it->second];
        if (entry and values_equal(entry->key, key)) {
            return it->second;
        }
    }
    return std::nullopt;
}

Value* OrderedTable::find_value(const Value& key) {
    auto pos = find(key);
    return pos ? &entries_[*pos]->value : nullptr;
}

bool OrderedTable::insert(Value key, Value value) {
    if (auto pos = find(key)) {
        entries_[*pos]->value = std::move(value);
        return false;
    }
    size_t hash = hash_value(key);
    entries_.emplace_back(Entry{.key = std::move(key), .value = std::move(value), .hash = hash});
    index_.emplace(hash, entries_.size() - 1);
    ++size_;
    return true;
}

bool OrderedTable::erase(const Value& key) {
    auto pos = find(key);
    if (not pos) {
        return false;
    }
    erase_at(*pos);
    return true;
}

void OrderedTable::erase_at(size_t pos) {
    auto& entry = entries_[pos];
    auto [beg, end] = index_.equal_range(entry->hash);
    for (auto it = beg; it != end; ++it) {
        if (it->second == pos) {
            index_.erase(it);
            break;
        }
    }
    // The entry may hold the last reference to an object that refers back to
    // this table, so it is detached before being destroyed
    auto detached = std::move(entry);
    entry.reset();
    --size_;
    if (entries_.size() > 16 and size_ < entries_.size() / 2) {
        compact();
    }
}

void OrderedTable::compact() {
    std::vector<std::optional<Entry>> entries;
    entries.reserve(size_);
    index_.clear();
    for (auto& entry : entries_) {
        if (entry) {
            index_.emplace(entry->hash, entries.size());
            entries.emplace_back(std::move(entry));
        }
    }
    entries_ = std::move(entries);
}

void OrderedTable::clear() noexcept {
    auto entries = std::move(entries_);
    entries_.clear();
    index_.clear();
    size_ = 0;
}

size_t OrderedTable::memory_usage() const noexcept {
    constexpr size_t index_node_size = 4 * sizeof(void*);
    return entries_.capacity() * sizeof(std::optional<Entry>) + index_.size() * index_node_size +
        index_.bucket_count() * sizeof(void*);
}

void OrderedTable::clear_refs(std::vector<ObjRef>& out) noexcept {
    for (auto& entry : entries_) {
        if (entry) {
            move_refs(entry->key, out);
            move_refs(entry->value, out);
        }
    }
    entries_.clear();
    index_.clear();
    size_ = 0;
}

} // namespace chk::lang
