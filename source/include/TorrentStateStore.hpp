#pragma once

#include <string>
#include <memory>
#include <mutex>
#include <atomic>
#include <optional>
#include <unordered_map>

#include <boost/asio.hpp>

#include "TorrentState.hpp"

class GlobalState;

// per torrent state keyed by hex info hash
// every entry owns a strand, state of one torrent is only touched from its strand
class TorrentStateStore {
    struct Entry;

public:
    using Strand = boost::asio::strand<boost::asio::any_io_executor>;

    // pins one entry for the duration of a request, a pinned entry is never evicted
    class Lease {
    public:
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&&) = delete;
        Lease(const Lease&) = delete;
        ~Lease();

        const std::string& hash() const { return _hash; }
        Strand strand() const;

    private:
        friend class TorrentStateStore;
        Lease(TorrentStateStore* store, std::string hash, std::shared_ptr<Entry> entry);

        TorrentStateStore* _store;
        std::string _hash;
        std::shared_ptr<Entry> _entry;
    };

    TorrentStateStore(boost::asio::any_io_executor exec, GlobalState& global, size_t max_entries = 0);

    // creates the entry lazily, requests posted to the lease's strand run in arrival order
    Lease acquire(const std::string& hash);

    // these must run on lease.strand()
    TorrentState record_and_get(Lease& lease, uint64_t downloaded, uint64_t uploaded, std::optional<uint64_t> left, Clock::time_point now);
    void commit(Lease& lease, uint64_t fake_uploaded, Clock::time_point now);
    std::optional<TorrentState> peek(const Lease& lease) const;

    // observation only, valid while no request for the hash is in flight
    std::optional<TorrentState> peek(const std::string& hash) const;

    size_t size() const;

private:
    struct Entry {
        explicit Entry(boost::asio::any_io_executor exec): strand(boost::asio::make_strand(exec)) {}

        Strand strand;
        TorrentState state;
        bool seen = false;

        // guarded by _mutex
        unsigned pins = 0;

        // read by eviction from outside the strand
        std::atomic<Clock::rep> last_touch{};
    };

    void release(Entry& entry);
    void evict_oldest(const std::string& keep);

    boost::asio::any_io_executor _exec;
    GlobalState& _global;
    size_t _max_entries;

    mutable std::mutex _mutex;
    std::unordered_map<std::string, std::shared_ptr<Entry>> _entries;
};
