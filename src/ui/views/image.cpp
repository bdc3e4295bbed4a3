/// @file image.cpp
/// @brief Image decoding and the image view

#include <loom/ui/views/image.hpp>

#include <loom/ui/children.hpp>

#include <loom/core/log.hpp>

#include <stb_image.h>

#include <cstring>
#include <filesystem>
#include <optional>

namespace loom_ui {

using loom_core::Err;
using loom_core::Ok;
using loom_core::ResourceError;
using loom_core::Result;

namespace {

Result<RgbaImage> copy_decoded(unsigned char* pixels, int width, int height) {
    RgbaImage image;
    image.width = width;
    image.height = height;
    const auto size = static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4;
    image.pixels.resize(size);
    std::memcpy(image.pixels.data(), pixels, size);
    stbi_image_free(pixels);
    return Ok(std::move(image));
}

std::string failure_reason() {
    const char* reason = stbi_failure_reason();
    return reason ? reason : "unknown error";
}

} // anonymous namespace

Result<RgbaImage> decode_image(const ImageSource& source) {
    int width = 0;
    int height = 0;
    int channels = 0;

    if (const auto* file = std::get_if<ImageFile>(&source)) {
        std::error_code ec;
        if (!std::filesystem::exists(file->path, ec)) {
            return Err<RgbaImage>(ResourceError::not_found(file->path));
        }
        unsigned char* pixels = stbi_load(file->path.c_str(), &width, &height, &channels, 4);
        if (!pixels) {
            return Err<RgbaImage>(ResourceError::unreadable(file->path, failure_reason()));
        }
        return copy_decoded(pixels, width, height);
    }

    if (const auto* encoded = std::get_if<EncodedImage>(&source)) {
        if (encoded->bytes.empty()) {
            return Err<RgbaImage>(ResourceError::malformed("memory", "no image data"));
        }
        unsigned char* pixels = stbi_load_from_memory(
            encoded->bytes.data(), static_cast<int>(encoded->bytes.size()),
            &width, &height, &channels, 4);
        if (!pixels) {
            return Err<RgbaImage>(ResourceError::malformed("memory", failure_reason()));
        }
        return copy_decoded(pixels, width, height);
    }

    const auto& rgba = std::get<RgbaImage>(source);
    if (rgba.width < 0 || rgba.height < 0 ||
        rgba.pixels.size() != static_cast<std::size_t>(rgba.width) * static_cast<std::size_t>(rgba.height) * 4) {
        return Err<RgbaImage>(ResourceError::malformed(
            "pixels", "expected " + std::to_string(rgba.width) + "x" + std::to_string(rgba.height) + " RGBA pixels"));
    }
    return Ok(rgba);
}

// =============================================================================
// ImageChildren
// =============================================================================

namespace {

/// Decoded image cache and the image widget living inside the node's container
class ImageChildren : public ChildrenStorage {
public:
    explicit ImageChildren(IBackend& backend)
        : image_widget(backend.create_image_view()), m_backend(backend) {}

    void teardown() override { m_backend.destroy_widget(image_widget); }

    /// Re-decode when the source differs from the cached one
    void load(const ImageSource& new_source) {
        if (source && *source == new_source) {
            return;
        }
        source = new_source;
        image_changed = true;

        auto decoded = decode_image(new_source);
        if (decoded.is_err()) {
            loom_core::debug::record_error(decoded.error());
            loom_core::backend_logger()->warn("Image not displayed: {}",
                                              loom_core::build_error_chain(decoded.error()));
            image.reset();
            return;
        }
        image = std::move(decoded).value();
    }

    WidgetHandle image_widget;
    std::optional<ImageSource> source;
    std::optional<RgbaImage> image;
    bool image_changed = false;
    std::optional<Size> displayed_size;
    double last_scale_factor = 0.0;
    bool container_empty = true;

private:
    IBackend& m_backend;
};

} // anonymous namespace

std::unique_ptr<ChildrenStorage> Image::children(
    IBackend& backend, const NodeSnapshot* /*snapshot*/, const Environment& /*environment*/) const {
    return std::make_unique<ImageChildren>(backend);
}

WidgetHandle Image::as_widget(ChildrenStorage& /*children*/, IBackend& backend) const {
    return backend.create_container();
}

LayoutResult Image::compute_layout(
    WidgetHandle /*widget*/, ChildrenStorage& children, const SizeProposal& proposal,
    const Environment& /*environment*/, IBackend& /*backend*/) const {
    auto& storage = storage_cast<ImageChildren>(children);
    storage.load(m_source);

    const Size pixel_size = storage.image ? storage.image->size() : Size::zero();
    if (!m_resizable) {
        return LayoutResult::leaf_view(ViewSize::fixed(pixel_size));
    }

    const Size size = storage.image ? proposal.evaluated(pixel_size) : Size::zero();
    const std::optional<int> maximum = storage.image ? std::nullopt : std::optional<int>(0);
    return LayoutResult::leaf_view(ViewSize(size, pixel_size, 0, 0, maximum, maximum));
}

void Image::commit(
    WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
    const Environment& environment, IBackend& backend) const {
    auto& storage = storage_cast<ImageChildren>(children);
    const Size size = layout.size.size;
    const double scale_factor = environment.window_scale_factor();

    const bool resized = storage.displayed_size != size;
    const bool rescaled = storage.last_scale_factor != scale_factor &&
                          backend.requires_image_update_on_scale_factor_change();

    if (storage.image_changed || resized || rescaled) {
        if (storage.image) {
            backend.update_image_view(storage.image_widget, *storage.image, size, scale_factor);
            if (storage.container_empty) {
                backend.add_child(storage.image_widget, widget);
                storage.container_empty = false;
            }
        } else if (!storage.container_empty) {
            backend.remove_all_children(widget);
            storage.container_empty = true;
        }
        storage.image_changed = false;
        storage.displayed_size = size;
        storage.last_scale_factor = scale_factor;
    }

    backend.set_size(widget, size);
    if (storage.image) {
        backend.set_size(storage.image_widget, size);
    }
}

} // namespace loom_ui
