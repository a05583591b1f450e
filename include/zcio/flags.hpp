#pragma once

#include <initializer_list>

#include <fcntl.h>

namespace zcio
{

/// Named splice(2)/tee(2) flags, values from <fcntl.h>.
enum class SpliceFlag : unsigned
{
    Move = SPLICE_F_MOVE,
    NonBlock = SPLICE_F_NONBLOCK,
    More = SPLICE_F_MORE,
    Gift = SPLICE_F_GIFT,
};

/**
 * Bitmask passed as the flags argument of tee(2) and splice(2).
 *
 * Built either from raw bits (explicit, for values obtained elsewhere) or
 * from named flags:
 *
 *   TransferFlags f{SpliceFlag::Move, SpliceFlag::NonBlock};
 *   auto g = SpliceFlag::Move | SpliceFlag::More;
 *   auto h = TransferFlags{SPLICE_F_MORE};
 *
 * Default-constructed flags are zero.
 */
class TransferFlags
{
public:
    constexpr TransferFlags() = default;
    constexpr explicit TransferFlags(const unsigned bits) : bits_(bits) {}
    constexpr TransferFlags(const SpliceFlag flag) : bits_(static_cast<unsigned>(flag)) {}

    constexpr TransferFlags(const std::initializer_list<SpliceFlag> flags)
    {
        for (const auto f : flags)
        {
            bits_ |= static_cast<unsigned>(f);
        }
    }

    [[nodiscard]] constexpr unsigned Bits() const { return bits_; }
    [[nodiscard]] constexpr bool Has(const SpliceFlag flag) const
    {
        return (bits_ & static_cast<unsigned>(flag)) != 0;
    }
    [[nodiscard]] constexpr bool Empty() const { return bits_ == 0; }

    constexpr TransferFlags& operator|=(const TransferFlags other)
    {
        bits_ |= other.bits_;
        return *this;
    }

    friend constexpr TransferFlags operator|(TransferFlags a, const TransferFlags b) { return a |= b; }
    friend constexpr bool operator==(TransferFlags, TransferFlags) = default;

private:
    unsigned bits_ = 0;
};

constexpr TransferFlags operator|(const SpliceFlag a, const SpliceFlag b)
{
    return TransferFlags{a} | TransferFlags{b};
}

}  // namespace zcio
