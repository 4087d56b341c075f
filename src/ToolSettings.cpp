#include "dat_toolkit/ToolSettings.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace dat_toolkit {

// ─────────────────────── option helpers ────────────────────────────────────
static const std::string* optFind(const Options& o, const std::string& k)
{
    auto it = o.params.find(k);
    return it == o.params.end() ? nullptr : &it->second;
}

static std::invalid_argument badValue(const std::string& k, const std::string& v)
{
    return std::invalid_argument("bad value for --" + k + ": '" + v + "'");
}

static double optD(const Options& o, const std::string& k, double def)
{
    const std::string* v = optFind(o, k);
    if (!v) return def;
    std::size_t used = 0;
    double d;
    try { d = std::stod(*v, &used); }
    catch (const std::exception&) { throw badValue(k, *v); }
    if (used != v->size() || !std::isfinite(d)) throw badValue(k, *v);
    return d;
}

static long long optRange(const Options& o, const std::string& k, long long def,
                          long long lo, long long hi)
{
    const std::string* v = optFind(o, k);
    if (!v) return def;
    std::size_t used = 0;
    long long n;
    // decimal, or hex with an explicit 0x prefix; leading zeros stay decimal
    const bool hex = v->size() > 2 && (*v)[0] == '0' && ((*v)[1] == 'x' || (*v)[1] == 'X');
    const std::string digits = hex ? v->substr(2) : *v;
    if (hex && (digits[0] == '-' || digits[0] == '+')) throw badValue(k, *v);
    try { n = std::stoll(digits, &used, hex ? 16 : 10); }
    catch (const std::exception&) { throw badValue(k, *v); }
    if (used != digits.size()) throw badValue(k, *v);
    if (n < lo || n > hi)
        throw std::invalid_argument("--" + k + " must be in [" + std::to_string(lo)
                                    + ", " + std::to_string(hi) + "], got " + *v);
    return n;
}

static bool optB(const Options& o, const std::string& k, bool def)
{
    const std::string* v = optFind(o, k);
    if (!v) return def;
    if (*v == "true"  || *v == "1" || *v == "yes" || *v == "on")  return true;
    if (*v == "false" || *v == "0" || *v == "no"  || *v == "off") return false;
    throw badValue(k, *v);
}

// ─────────────────────────── fromOptions ───────────────────────────────────
ToolSettings ToolSettings::fromOptions(const Options& opts)
{
    ToolSettings s;
    s.params.multiplier = optD(opts, "multiplier", s.params.multiplier);
    s.params.areaId   = static_cast<std::uint16_t>(optRange(opts, "area_id",   0, 0, 0xFFFF));
    s.params.width    = static_cast<std::uint16_t>(optRange(opts, "width",     0, 0, 0xFFFF));
    s.params.nodeType = static_cast<std::uint8_t> (optRange(opts, "node_type", 0, 0, 0xFF));
    s.params.flags    = static_cast<std::uint8_t> (optRange(opts, "flags",     0, 0, 0xFF));

    s.backup     = optB(opts, "backup", s.backup);
    // clamped to the pool limits later; only reject nonsense here
    s.threads    = static_cast<int>(optRange(opts, "threads", s.threads,
                                             std::numeric_limits<int>::min(),
                                             std::numeric_limits<int>::max()));
    s.maxPreview = static_cast<std::size_t>(optRange(opts, "max_preview",
                                                     static_cast<long long>(s.maxPreview),
                                                     0, std::numeric_limits<int>::max()));
    return s;
}

} // namespace dat_toolkit
