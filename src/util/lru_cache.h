#pragma once

#include <unordered_map>
#include <list>
#include <cassert>
#include <cstddef>
#include <functional>

namespace httpsig { namespace util {

// Bounded map which drops the least recently used entry
// when an insertion exceeds its capacity.  Not thread safe.
template<typename Key, typename Value>
class LruCache {
private:
    using KeyVal = std::pair<Key, Value>;
    using ListIter = typename std::list<KeyVal>::iterator;
    using Map = std::unordered_map<Key, ListIter>;

public:
    // Called with the key and value of every entry dropped to make room.
    using OnEvict = std::function<void(const Key&, const Value&)>;

public:
    // Iteration goes from the most to the least recently used entry.
    using iterator = ListIter;

public:
    LruCache(size_t max_size, OnEvict on_evict = nullptr)
        : _max_size(max_size)
        , _on_evict(std::move(on_evict))
    { }

    Value* put(const Key& key, Value value) {
        // When modifying this func be careful to handle the case
        // when `key` is a reference to the key already in the cache.
        // E.g. cache.put(i->first, "new value");

        auto it = _map.find(key);

        _list.push_front(KeyVal(key, std::move(value)));

        if (it != _map.end()) {
            _list.erase(it->second);
            it->second = _list.begin();
        }
        else {
            _map[_list.front().first] = _list.begin();
        }

        while (_map.size() > _max_size) {
            auto last = std::prev(_list.end());
            if (_on_evict) _on_evict(last->first, last->second);
            _map.erase(last->first);
            _list.pop_back();
        }

        if (_list.empty()) return nullptr;  // zero capacity
        return &_list.begin()->second;
    }

    // Marks the entry as the most recently used one.
    Value* get(const Key& key) {
        auto it = _map.find(key);

        if (it == _map.end()) return nullptr;

        _list.splice(_list.begin(), _list, it->second);

        assert(it->second == _list.begin());

        return &it->second->second;
    }

    // Does not change the usage order.
    const Value* peek(const Key& key) const {
        auto it = _map.find(key);
        if (it == _map.end()) return nullptr;
        return &it->second->second;
    }

    bool exists(const Key& key) const {
        return _map.count(key) != 0;
    }

    bool erase(const Key& key) {
        auto it = _map.find(key);
        if (it == _map.end()) return false;
        _list.erase(it->second);
        _map.erase(it);
        return true;
    }

    iterator erase(iterator i) {
        _map.erase(i->first);
        return _list.erase(i);
    }

    void clear() {
        _map.clear();
        _list.clear();
    }

    size_t size() const {
        return _map.size();
    }

    size_t max_size() const { return _max_size; }

    bool empty() const { return _map.empty(); }

    iterator begin() { return _list.begin(); }
    iterator end() { return _list.end(); }

private:
    std::list<KeyVal> _list;
    Map _map;
    size_t _max_size;
    OnEvict _on_evict;
};

}} // namespaces
