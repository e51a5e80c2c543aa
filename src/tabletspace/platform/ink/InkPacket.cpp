#include "platform/ink/InkPacket.hpp"
#include "log/TaggedLogger.hpp"

#include <array>

namespace TS {
namespace {

auto violation(std::string_view detail) -> Error {
    return Error{Error::Code::ProtocolViolation, "packet description: " + std::string{detail}};
}

// Pairs an x/y property, substituting 0 for a missing half.
auto pairOf(NicheF32 x, NicheF32 y) -> std::optional<std::array<float, 2>> {
    if (!x.isSome() && !y.isSome())
        return std::nullopt;
    return std::array<float, 2>{x.get().value_or(0.0f), y.get().value_or(0.0f)};
}

auto scalerOf(Tristate<std::pair<Scaler, Info>> const& calibrated) -> ScalerSlot {
    return calibrated.mapOk([](std::pair<Scaler, Info> const& p) { return p.first; });
}

auto scalerOf(Tristate<std::pair<Scaler, LengthInfo>> const& calibrated) -> ScalerSlot {
    return calibrated.mapOk([](std::pair<Scaler, LengthInfo> const& p) { return p.first; });
}

} // namespace

auto Interpreter::consume(float himetricToPx, std::span<std::int32_t const> words) const -> Expected<std::pair<Pose, std::optional<FrameTimestamp>>> {
    if (words.size() < 2)
        return std::unexpected(Error{Error::Code::NotEnoughData, "property slice empty"});

    Pose pose;
    pose.position = {static_cast<float>(words[0]) * himetricToPx, static_cast<float>(words[1]) * himetricToPx};
    words         = words.subspan(2);

    NicheF32                      tilt[2];
    NicheF32                      size[2];
    std::optional<FrameTimestamp> timestamp;
    for (auto const& slot : this->slots) {
        if (slot.property == InkProperty::TimerTick) {
            if (words.empty())
                return std::unexpected(Error{Error::Code::NotEnoughData, "property slice empty"});
            auto const tick = words.front();
            words           = words.subspan(1);
            if (tick < 0)
                return std::unexpected(Error{Error::Code::Value, "negative timer tick"});
            timestamp = FrameTimestamp::fromMillis(static_cast<std::uint64_t>(tick));
            continue;
        }
        auto value = readSlot(slot.scaler, words);
        if (!value)
            return std::unexpected(value.error());
        switch (slot.property) {
        case InkProperty::NormalPressure:
            pose.pressure = *value;
            break;
        case InkProperty::XTilt:
            tilt[0] = *value;
            break;
        case InkProperty::YTilt:
            tilt[1] = *value;
            break;
        case InkProperty::Z:
            pose.distance = *value;
            break;
        case InkProperty::Twist:
            pose.roll = *value;
            break;
        case InkProperty::ButtonPressure:
            pose.buttonPressure = *value;
            break;
        case InkProperty::Width:
            size[0] = *value;
            break;
        case InkProperty::Height:
            size[1] = *value;
            break;
        case InkProperty::X:
        case InkProperty::Y:
        case InkProperty::TimerTick:
        case InkProperty::PacketStatus:
            break;
        }
    }
    if (!words.empty())
        return std::unexpected(Error{Error::Code::TooMuchData, "property slice too long"});

    pose.tilt        = pairOf(tilt[0], tilt[1]);
    pose.contactSize = pairOf(size[0], size[1]);
    return std::pair<Pose, std::optional<FrameTimestamp>>{pose, timestamp};
}

auto makeInterpreter(InkPacketLayout const& layout, std::span<InkPropertyDescription const> reported) -> Expected<std::pair<Interpreter, FullInfo>> {
    if (auto valid = layout.validate(); !valid)
        return std::unexpected(valid.error());
    auto const& desired = layout.properties;
    if (reported.size() > desired.size())
        return std::unexpected(violation("more properties than requested"));

    // Ordered subset check, which also rules out duplicates.
    std::size_t cursor = 0;
    for (auto const& description : reported) {
        while (cursor < desired.size() && desired[cursor] != description.property)
            ++cursor;
        if (cursor == desired.size())
            return std::unexpected(violation("properties out of order or not requested"));
        ++cursor;
    }
    if (reported.size() < 3 || reported[0].property != InkProperty::X || reported[1].property != InkProperty::Y
        || reported.back().property != InkProperty::PacketStatus)
        return std::unexpected(violation("X, Y or PacketStatus missing"));

    Interpreter interpreter;
    FullInfo    info;
    for (auto const& description : reported.subspan(2, reported.size() - 3)) {
        auto const& metrics = description.metrics;
        Interpreter::Slot slot;
        slot.property = description.property;
        switch (description.property) {
        case InkProperty::NormalPressure:
        case InkProperty::ButtonPressure: {
            auto calibrated = normalized(metrics, Limits{0.0f, 1.0f});
            slot.scaler     = scalerOf(calibrated);
            std::optional<NormalizedInfo> axis;
            if (calibrated.value())
                axis = NormalizedInfo{calibrated.value()->second.granularity};
            (description.property == InkProperty::NormalPressure ? info.pressure : info.buttonPressure) = axis;
            break;
        }
        case InkProperty::XTilt:
        case InkProperty::YTilt: {
            auto calibrated = halfAngleOrNormalize(metrics);
            slot.scaler     = scalerOf(calibrated);
            if (calibrated.value())
                info.tilt = unionOptional(info.tilt, std::optional<Info>{calibrated.value()->second});
            break;
        }
        case InkProperty::Twist: {
            auto calibrated = normalized(metrics, Limits{0.0f, kTauExclusive});
            slot.scaler     = scalerOf(calibrated);
            if (calibrated.value())
                info.roll = CircularInfo{calibrated.value()->second.granularity};
            break;
        }
        case InkProperty::Z: {
            auto calibrated = linearOrNormalize(metrics);
            slot.scaler     = scalerOf(calibrated);
            if (calibrated.value())
                info.distance = calibrated.value()->second;
            break;
        }
        case InkProperty::Width:
        case InkProperty::Height: {
            auto calibrated = linearOrNormalize(metrics);
            slot.scaler     = scalerOf(calibrated);
            if (calibrated.value())
                info.contactSize = unionOptional(info.contactSize, std::optional<LengthInfo>{calibrated.value()->second});
            break;
        }
        case InkProperty::TimerTick:
            break;
        case InkProperty::X:
        case InkProperty::Y:
        case InkProperty::PacketStatus:
            return std::unexpected(violation("fixed property in the middle of a packet"));
        }
        interpreter.slots.push_back(slot);
    }
    return std::pair<Interpreter, FullInfo>{std::move(interpreter), info};
}

auto decodePackets(Interpreter const& interpreter, float himetricToPx, std::span<std::int32_t const> words, std::size_t wordsPerPacket) -> std::vector<InkPacket> {
    std::vector<InkPacket> packets;
    if (wordsPerPacket == 0)
        return packets;
    auto const whole = words.size() / wordsPerPacket * wordsPerPacket;
    for (std::size_t offset = 0; offset < whole; offset += wordsPerPacket) {
        auto const packet  = words.subspan(offset, wordsPerPacket);
        auto       decoded = interpreter.consume(himetricToPx, packet.first(packet.size() - 1));
        if (!decoded) {
            ts_log("Dropping undecodable ink packets: " + describeError(decoded.error()), "Ink", "Packet");
            break;
        }
        packets.push_back(InkPacket{decoded->first, decoded->second, StatusWord{packet.back()}});
    }
    return packets;
}

} // namespace TS
