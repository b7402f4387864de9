// SPDX-License-Identifier: Apache-2.0
#include <tui/Spinner.hpp>

#include <array>

namespace chisel::tui
{

namespace
{

// Spinner frame definitions
constexpr std::array DotsFrames = {
    std::string_view { "\u280B" }, // ⠋
    std::string_view { "\u2819" }, // ⠙
    std::string_view { "\u2839" }, // ⠹
    std::string_view { "\u2838" }, // ⠸
    std::string_view { "\u283C" }, // ⠼
    std::string_view { "\u2834" }, // ⠴
    std::string_view { "\u2826" }, // ⠦
    std::string_view { "\u2827" }, // ⠧
    std::string_view { "\u2807" }, // ⠇
    std::string_view { "\u280F" }, // ⠏
};

constexpr std::array LineFrames = {
    std::string_view { "-" },
    std::string_view { "\\" },
    std::string_view { "|" },
    std::string_view { "/" },
};

constexpr std::array CircleFrames = {
    std::string_view { "\u25D0" }, // ◐
    std::string_view { "\u25D3" }, // ◓
    std::string_view { "\u25D1" }, // ◑
    std::string_view { "\u25D2" }, // ◒
};

constexpr std::array ArcFrames = {
    std::string_view { "\u25DC" }, // ◜
    std::string_view { "\u25E0" }, // ◠
    std::string_view { "\u25DD" }, // ◝
    std::string_view { "\u25DE" }, // ◞
    std::string_view { "\u25E1" }, // ◡
    std::string_view { "\u25DF" }, // ◟
};

constexpr std::array BounceFrames = {
    std::string_view { "\u2801" }, // ⠁
    std::string_view { "\u2802" }, // ⠂
    std::string_view { "\u2804" }, // ⠄
    std::string_view { "\u2802" }, // ⠂
};

} // namespace

auto spinnerFrames(SpinnerType type) -> std::span<std::string_view const>
{
    switch (type)
    {
        case SpinnerType::Dots:
            return DotsFrames;
        case SpinnerType::Line:
            return LineFrames;
        case SpinnerType::Circle:
            return CircleFrames;
        case SpinnerType::Arc:
            return ArcFrames;
        case SpinnerType::Bounce:
            return BounceFrames;
    }
    return DotsFrames;
}

auto spinnerInterval(SpinnerType type) -> std::chrono::milliseconds
{
    switch (type)
    {
        case SpinnerType::Dots:
            return std::chrono::milliseconds { 80 };
        case SpinnerType::Line:
            return std::chrono::milliseconds { 100 };
        case SpinnerType::Circle:
            return std::chrono::milliseconds { 120 };
        case SpinnerType::Arc:
            return std::chrono::milliseconds { 100 };
        case SpinnerType::Bounce:
            return std::chrono::milliseconds { 120 };
    }
    return std::chrono::milliseconds { 100 };
}

auto parseSpinnerType(std::string_view name) -> std::optional<SpinnerType>
{
    if (name == "dots")
        return SpinnerType::Dots;
    if (name == "line")
        return SpinnerType::Line;
    if (name == "circle")
        return SpinnerType::Circle;
    if (name == "arc")
        return SpinnerType::Arc;
    if (name == "bounce")
        return SpinnerType::Bounce;
    return std::nullopt;
}

Spinner::Spinner(SpinnerType type): _frames(spinnerFrames(type))
{
}

void Spinner::advance() noexcept
{
    if (!_frames.empty())
        _frameIndex = (_frameIndex + 1) % _frames.size();
}

auto Spinner::currentFrame() const noexcept -> std::string_view
{
    if (_frames.empty())
        return "";
    return _frames[_frameIndex];
}

auto Spinner::frameIndex() const noexcept -> std::size_t
{
    return _frameIndex;
}

auto Spinner::frameCount() const noexcept -> std::size_t
{
    return _frames.size();
}

void Spinner::reset() noexcept
{
    _frameIndex = 0;
}

} // namespace chisel::tui
