#include "io/Preflight.hpp"
#include <limits>
#include <sstream>

#ifdef __linux__
#include <sys/sysinfo.h>
#endif

namespace chunkpool::io
{

std::pair<bool, std::string> run_preflight(const PoolConfig& cfg, std::size_t available_ram_bytes)
{
    const std::size_t worst = cfg.worst_case_bytes();

    // Rough RAM bound: every buffer in flight plus some headroom
    const std::size_t overhead = worst / 8 + (64ull << 20); // 12.5% + 64MB
    const bool saturated = worst > std::numeric_limits<std::size_t>::max() - overhead;
    const bool ram_ok = !saturated && worst + overhead < available_ram_bytes;

    std::ostringstream msg;
    msg << "Preflight: buffer_size=" << cfg.buffer_size << ", capacity=" << cfg.capacity
        << ", worst_case_bytes=" << worst << ", available_ram_bytes=" << available_ram_bytes
        << ", conversion=" << (cfg.conversion == PoolConfig::Conversion::Wrap ? "wrap" : "copy")
        << ".";

    if (saturated)
        msg << " Worst case overflows size_t.";
    if (!ram_ok)
        msg << " RAM check failed.";
    return {ram_ok, msg.str()};
}

std::size_t query_available_ram_bytes() noexcept
{
#ifdef __linux__
    struct sysinfo si{};
    if (sysinfo(&si) == 0)
        return (std::size_t) si.freeram * si.mem_unit;
#endif
    return 0;
}

} // namespace chunkpool::io
