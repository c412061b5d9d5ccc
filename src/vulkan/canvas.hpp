#pragma once

/// @file canvas.hpp
/// @brief Vulkan implementation of the 2D Renderer: CPU tessellation into a storage buffer.

#include "core/types.hpp"
#include "rendering/renderer.hpp"
#include "rendering/stroke_font.hpp"
#include "rendering/surface.hpp"
#include "vulkan/context.hpp"

#include <vulkan/vulkan.h>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace orrery::vulkan
{
    /// @brief One tessellated vertex. Matches the std430 struct in canvas.vert.
    struct CanvasVertex
    {
        Vec2f position;    ///< Screen pixels, y down
        Vec2f padding;
        Vec4f color;       ///< Straight (non-premultiplied) RGBA
    };
    static_assert(sizeof(CanvasVertex) == 32, "CanvasVertex must match the shader layout");

    struct CanvasPushConstants
    {
        Vec2f viewport;    ///< Framebuffer size in pixels
    };

    /// @brief Contiguous vertex range drawn under one scissor rectangle.
    struct DrawBatch
    {
        VkRect2D scissor{};
        u32 first_vertex = 0;
        u32 vertex_count = 0;
    };

    /// @brief Immediate-mode triangle canvas.
    ///
    /// Each frame: begin_frame() resets the vertex list, draw calls append
    /// triangles (disks as fans, strokes as one quad per segment), and
    /// record() uploads the list into the frame slot's persistently mapped
    /// storage buffer and issues one draw per scissor batch. Blending is
    /// standard source-over alpha.
    class Canvas final : public rendering::Renderer
    {
    public:
        Canvas(const Context& context,
               VkRenderPass render_pass,
               const std::filesystem::path& shader_dir,
               u32 frames_in_flight,
               u32 max_vertices = kDefaultMaxVertices);
        ~Canvas() override;

        Canvas(const Canvas&) = delete;
        Canvas& operator=(const Canvas&) = delete;
        Canvas(Canvas&&) = delete;
        Canvas& operator=(Canvas&&) = delete;

        /// @brief Start collecting geometry for @p frame_slot at the given framebuffer size.
        void begin_frame(u32 frame_slot, VkExtent2D extent);

        /// @brief Upload this frame's vertices and record the draws.
        /// Must be called inside the render pass the canvas was built for.
        void record(VkCommandBuffer cmd);

        void draw_circle(Vec2d center, f64 radius, Color color) override;
        void draw_polyline(std::span<const Vec2d> points, bool closed,
                           Color color, f64 width) override;
        void blit(const rendering::Surface& surface, Rect dest) override;
        [[nodiscard]] rendering::Surface text_to_surface(std::string_view text, Color color) override;

        [[nodiscard]] u32 vertex_count() const { return static_cast<u32>(m_vertices.size()); }
        [[nodiscard]] std::size_t batch_count() const { return m_batches.size(); }

        static constexpr u32 kDefaultMaxVertices = 1u << 18;

    private:
        struct FrameBuffer
        {
            VkBuffer buffer = VK_NULL_HANDLE;
            VkDeviceMemory memory = VK_NULL_HANDLE;
            void* mapped = nullptr;
            VkDescriptorSet descriptor_set = VK_NULL_HANDLE;
        };

        void create_frame_buffers(u32 frames_in_flight);
        void create_descriptors();
        void create_pipeline(VkRenderPass render_pass, const std::filesystem::path& shader_dir);

        void set_scissor(const VkRect2D& scissor);
        void push_triangle(Vec2d a, Vec2d b, Vec2d c, const Vec4f& color);
        void emit_disk(Vec2d center, f64 radius, const Vec4f& color);
        void emit_segment(Vec2d from, Vec2d to, f64 width, const Vec4f& color);
        void emit_rect(const Rect& rect, const Vec4f& color);
        void emit_primitive(const rendering::Primitive& primitive, Vec2d offset);

        const Context& m_context;
        rendering::StrokeFont m_font;

        std::vector<FrameBuffer> m_frames;
        u32 m_capacity = 0;
        u32 m_frame_slot = 0;

        VkDescriptorSetLayout m_descriptor_set_layout = VK_NULL_HANDLE;
        VkDescriptorPool m_descriptor_pool = VK_NULL_HANDLE;
        VkPipelineLayout m_pipeline_layout = VK_NULL_HANDLE;
        VkPipeline m_pipeline = VK_NULL_HANDLE;

        VkExtent2D m_extent{0, 0};
        std::vector<CanvasVertex> m_vertices;
        std::vector<DrawBatch> m_batches;
        VkRect2D m_scissor{};
        bool m_overflow_reported = false;
    };

} // namespace orrery::vulkan
