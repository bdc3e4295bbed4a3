#pragma once

/// @file image.hpp
/// @brief Image leaf backed by stb_image decoding

#include <loom/ui/view.hpp>

#include <loom/core/error.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace loom_ui {

// =============================================================================
// Image Sources
// =============================================================================

/// Image file on disk (PNG, JPEG, BMP, TGA, GIF, PNM...)
struct ImageFile {
    std::string path;
    bool operator==(const ImageFile&) const = default;
};

/// Encoded image bytes held in memory
struct EncodedImage {
    std::vector<std::uint8_t> bytes;
    bool operator==(const EncodedImage&) const = default;
};

using ImageSource = std::variant<ImageFile, EncodedImage, RgbaImage>;

/// Decode any image source to RGBA8
[[nodiscard]] loom_core::Result<RgbaImage> decode_image(const ImageSource& source);

// =============================================================================
// Image
// =============================================================================

/// Displays a decoded image.
///
/// The decoded image is cached in the node and only re-decoded when the
/// source changes. A source that fails to decode logs a warning and lays out
/// as a zero-size leaf.
class Image : public View {
public:
    explicit Image(ImageSource source) : m_source(std::move(source)) {}

    /// Let the image stretch to the proposed size instead of its pixel size
    [[nodiscard]] Image resizable(bool resizable = true) const {
        Image copy = *this;
        copy.m_resizable = resizable;
        return copy;
    }

    [[nodiscard]] std::string name() const override { return "Image"; }
    [[nodiscard]] const ImageSource& source() const noexcept { return m_source; }
    [[nodiscard]] bool is_resizable() const noexcept { return m_resizable; }

    [[nodiscard]] std::unique_ptr<ChildrenStorage> children(
        IBackend& backend, const NodeSnapshot* snapshot, const Environment& environment) const override;

    [[nodiscard]] WidgetHandle as_widget(ChildrenStorage& children, IBackend& backend) const override;

    [[nodiscard]] LayoutResult compute_layout(
        WidgetHandle widget, ChildrenStorage& children, const SizeProposal& proposal,
        const Environment& environment, IBackend& backend) const override;

    void commit(
        WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
        const Environment& environment, IBackend& backend) const override;

private:
    ImageSource m_source;
    bool m_resizable = false;
};

} // namespace loom_ui
