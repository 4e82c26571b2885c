#include "Log.hpp"
#include "io/ConfigYAML.hpp" // AppConfig + load_config_from_yaml()
#include "io/PoolConfig.hpp"
#include "io/Preflight.hpp"
#include "io/WireBytes.hpp"
#include "memory/BufferPool.hpp"
#include "memory/ChunkBuffer.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <iostream>
#include <random>
#include <span>
#include <vector>

using chunkpool::io::make_conversion;
using chunkpool::io::query_available_ram_bytes;
using chunkpool::io::run_preflight;
using chunkpool::io::WireBytes;
using chunkpool::memory::BufferPool;
using chunkpool::memory::ChunkBuffer;

namespace
{

// Flushed buffer awaiting its in-order acknowledgment.
struct Pending
{
    const ChunkBuffer* buffer;
    WireBytes wire;
};

struct Totals
{
    std::size_t bytes_written = 0;
    std::size_t bytes_acked = 0;
    std::size_t flushes = 0;
    std::size_t max_in_flight = 0;
    std::size_t max_staged = 0;
    std::uint64_t hash_written = 1469598103934665603ull; // FNV-1a offset basis
    std::uint64_t hash_acked = 1469598103934665603ull;
};

inline void fnv1a(std::uint64_t& h, std::span<const std::byte> bytes)
{
    for (std::byte b : bytes)
    {
        h ^= static_cast<std::uint64_t>(b);
        h *= 1099511628211ull;
    }
}

// Downstream accepted the oldest flushed chunk: account for it and recycle its buffer.
void acknowledge_oldest(BufferPool& pool, std::deque<Pending>& pending, Totals& t)
{
    Pending& head = pending.front();
    fnv1a(t.hash_acked, head.wire.bytes());
    t.bytes_acked += head.wire.size();
    pool.release(*head.buffer);
    pending.pop_front();
}

void flush(BufferPool& pool, ChunkBuffer& buf, std::deque<Pending>& pending, Totals& t)
{
    pending.push_back(Pending{&buf, pool.conversion()(buf.written())});
    ++t.flushes;
    LOGD("[sim] flush #%zu bytes=%zu in_flight=%zu\n", t.flushes, buf.position(),
         pool.in_flight());
}

} // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        std::cerr << "usage: " << argv[0] << " <config.yml>\n";
        return 2;
    }

    AppConfig cfg;
    try
    {
        cfg = load_config_from_yaml(argv[1]);
    }
    catch (const std::exception& e)
    {
        LOGE("[config] %s: %s\n", argv[1], e.what());
        return 1;
    }
    chunkpool::logx::init({cfg.log_level});

    if (cfg.preflight.enabled)
    {
        const std::size_t ram = cfg.preflight.ram_bytes.value_or(query_available_ram_bytes());
        auto [ok, msg] = run_preflight(cfg.pool, ram);
        LOGI("%s\n", msg.c_str());
        if (!ok)
        {
            LOGE("Preflight failed: reduce pool.capacity or pool.buffer_size.\n");
            return 1;
        }
    }

    LOGI("[run] buffer_size=%zu capacity=%zu chunks=%d write_bytes=%zu\n", cfg.pool.buffer_size,
         cfg.pool.capacity, cfg.sim.chunks, cfg.sim.write_bytes);

    Totals t;
    std::size_t pool_size = 0;
    try
    {
        BufferPool pool(cfg.pool.buffer_size, cfg.pool.capacity, make_conversion(cfg.pool));
        std::deque<Pending> pending;

        std::mt19937 rng(cfg.sim.seed);
        std::uniform_int_distribution<int> dist(0, 255);
        std::vector<std::byte> payload(cfg.sim.write_bytes);

        for (int c = 0; c < cfg.sim.chunks; ++c)
        {
            for (auto& b : payload)
                b = static_cast<std::byte>(dist(rng));
            fnv1a(t.hash_written, payload);
            t.bytes_written += payload.size();

            std::span<const std::byte> rest(payload);
            while (!rest.empty())
            {
                ChunkBuffer& buf = pool.allocate_or_reuse_active();
                rest = rest.subspan(buf.put_some(rest));
                t.max_staged = std::max(t.max_staged, pool.total_buffered_bytes());
                if (!buf.has_remaining())
                {
                    flush(pool, buf, pending, t);
                    t.max_in_flight = std::max(t.max_in_flight, pool.in_flight());
                    // Window is full: wait for the oldest acknowledgment.
                    while (pool.in_flight() >= pool.capacity())
                        acknowledge_oldest(pool, pending, t);
                }
            }
        }

        // Trailing partial chunk.
        ChunkBuffer* cur = pool.current_buffer();
        if (cur && cur->position() > 0 && (pending.empty() || pending.back().buffer != cur))
            flush(pool, *cur, pending, t);
        t.max_in_flight = std::max(t.max_in_flight, pool.in_flight());

        while (!pending.empty())
            acknowledge_oldest(pool, pending, t);

        pool.assert_empty();
        pool_size = pool.size();
        pool.reset();
    }
    catch (const std::exception& e)
    {
        LOGE("[sim] aborted: %s\n", e.what());
        return 1;
    }

    std::cout << "written_bytes=" << t.bytes_written << " acked_bytes=" << t.bytes_acked
              << " flushes=" << t.flushes << " pool_size=" << pool_size
              << " max_in_flight=" << t.max_in_flight << " max_staged=" << t.max_staged << '\n';

    if (t.bytes_written != t.bytes_acked || t.hash_written != t.hash_acked)
    {
        LOGE("[sim] acknowledged stream differs from written stream\n");
        return 1;
    }
    LOGI("[sim] ok\n");
    return 0;
}
