#pragma once
#include "calibration/Calibration.hpp"
#include "config/InkPacketLayout.hpp"
#include "core/Axis.hpp"
#include "core/Error.hpp"
#include "core/FrameTimestamp.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace TS {

// One entry of what the tablet reports back for the requested description.
struct InkPropertyDescription {
    InkProperty     property = InkProperty::X;
    PropertyMetrics metrics;
};

// Last word of every packet.
struct StatusWord {
    static constexpr std::int32_t DOWN     = 1;
    static constexpr std::int32_t INVERTED = 2;
    static constexpr std::int32_t BARREL   = 8;

    std::int32_t bits = 0;

    [[nodiscard]] auto contains(std::int32_t flag) const -> bool { return (this->bits & flag) == flag; }
};

struct InkPacket {
    Pose                          pose;
    std::optional<FrameTimestamp> timestamp;
    StatusWord                    status;
};

/**
 * Decodes the words of one packet of one tablet into a Pose. Built by
 * makeInterpreter() from the properties the tablet reported.
 */
class Interpreter {
public:
    // `words` excludes the status word. TooMuchData when words are left over,
    // NotEnoughData when the slice is short and Value for a negative timer.
    [[nodiscard]] auto consume(float himetricToPx, std::span<std::int32_t const> words) const -> Expected<std::pair<Pose, std::optional<FrameTimestamp>>>;

private:
    friend auto makeInterpreter(InkPacketLayout const& layout, std::span<InkPropertyDescription const> reported)
            -> Expected<std::pair<Interpreter, FullInfo>>;

    struct Slot {
        InkProperty property = InkProperty::X;
        // Unused for TimerTick, which is always whole milliseconds.
        ScalerSlot scaler;
    };

    // Packet order, X, Y and the status word excluded.
    std::vector<Slot> slots;
};

// ProtocolViolation unless `reported` is an ordered subset of `layout` that
// starts with X, Y and ends with PacketStatus.
[[nodiscard]] auto makeInterpreter(InkPacketLayout const& layout, std::span<InkPropertyDescription const> reported)
        -> Expected<std::pair<Interpreter, FullInfo>>;

// Splits `words` into packets of `wordsPerPacket` words (status word
// included), dropping a trailing partial packet. Decoding stops at the first
// packet that fails.
[[nodiscard]] auto decodePackets(Interpreter const& interpreter, float himetricToPx, std::span<std::int32_t const> words, std::size_t wordsPerPacket)
        -> std::vector<InkPacket>;

} // namespace TS
