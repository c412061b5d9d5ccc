/// @file canvas.cpp
/// @brief Canvas: tessellation, per-frame storage buffers and the alpha-blended pipeline.

#include "vulkan/canvas.hpp"

#include "core/logger.hpp"
#include "vulkan/vk_check.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <type_traits>
#include <variant>

namespace
{

constexpr orrery::i32 kMinDiskSegments = 12;
constexpr orrery::i32 kMaxDiskSegments = 64;

bool same_rect(const VkRect2D& a, const VkRect2D& b)
{
    return a.offset.x == b.offset.x && a.offset.y == b.offset.y
        && a.extent.width == b.extent.width && a.extent.height == b.extent.height;
}

} // anonymous namespace

namespace orrery::vulkan
{

Canvas::Canvas(const Context& context,
               VkRenderPass render_pass,
               const std::filesystem::path& shader_dir,
               u32 frames_in_flight,
               u32 max_vertices)
    : m_context{context}
    , m_capacity{max_vertices}
{
    create_descriptors();
    create_frame_buffers(frames_in_flight);
    create_pipeline(render_pass, shader_dir);
    m_vertices.reserve(max_vertices);

    ORR_CORE_INFO("Canvas initialized ({} frame buffers, {} vertices each)", frames_in_flight, max_vertices);
}

Canvas::~Canvas()
{
    VkDevice device = m_context.get_device();

    if (m_pipeline != VK_NULL_HANDLE)
    {
        vkDestroyPipeline(device, m_pipeline, nullptr);
    }
    if (m_pipeline_layout != VK_NULL_HANDLE)
    {
        vkDestroyPipelineLayout(device, m_pipeline_layout, nullptr);
    }
    for (FrameBuffer& frame : m_frames)
    {
        if (frame.buffer != VK_NULL_HANDLE)
        {
            vkDestroyBuffer(device, frame.buffer, nullptr);
        }
        if (frame.memory != VK_NULL_HANDLE)
        {
            vkFreeMemory(device, frame.memory, nullptr);
        }
    }
    if (m_descriptor_pool != VK_NULL_HANDLE)
    {
        vkDestroyDescriptorPool(device, m_descriptor_pool, nullptr);
    }
    if (m_descriptor_set_layout != VK_NULL_HANDLE)
    {
        vkDestroyDescriptorSetLayout(device, m_descriptor_set_layout, nullptr);
    }

    ORR_CORE_TRACE("Canvas destroyed");
}

// =================================================================
// Frame recording
// =================================================================

void Canvas::begin_frame(u32 frame_slot, VkExtent2D extent)
{
    m_frame_slot = frame_slot % static_cast<u32>(m_frames.size());
    m_extent = extent;
    m_vertices.clear();
    m_batches.clear();

    VkRect2D full{};
    full.extent = extent;
    set_scissor(full);
}

void Canvas::record(VkCommandBuffer cmd)
{
    if (m_vertices.empty())
    {
        return;
    }

    const FrameBuffer& frame = m_frames[m_frame_slot];
    std::memcpy(frame.mapped, m_vertices.data(), m_vertices.size() * sizeof(CanvasVertex));

    vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, m_pipeline);
    vkCmdBindDescriptorSets(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, m_pipeline_layout,
                            0, 1, &frame.descriptor_set, 0, nullptr);

    const CanvasPushConstants push{
        .viewport = Vec2f{static_cast<f32>(m_extent.width), static_cast<f32>(m_extent.height)},
    };
    vkCmdPushConstants(cmd, m_pipeline_layout, VK_SHADER_STAGE_VERTEX_BIT,
                       0, sizeof(CanvasPushConstants), &push);

    VkViewport viewport{};
    viewport.width = static_cast<float>(m_extent.width);
    viewport.height = static_cast<float>(m_extent.height);
    viewport.maxDepth = 1.0f;
    vkCmdSetViewport(cmd, 0, 1, &viewport);

    for (const DrawBatch& batch : m_batches)
    {
        if (batch.vertex_count == 0)
        {
            continue;
        }
        vkCmdSetScissor(cmd, 0, 1, &batch.scissor);
        vkCmdDraw(cmd, batch.vertex_count, 1, batch.first_vertex, 0);
    }
}

// =================================================================
// Renderer interface
// =================================================================

void Canvas::draw_circle(Vec2d center, f64 radius, Color color)
{
    emit_disk(center, radius, color.to_vec4());
}

void Canvas::draw_polyline(std::span<const Vec2d> points, bool closed, Color color, f64 width)
{
    if (points.size() < 2)
    {
        return;
    }

    const Vec4f rgba = color.to_vec4();
    for (std::size_t i = 1; i < points.size(); ++i)
    {
        emit_segment(points[i - 1], points[i], width, rgba);
    }
    if (closed)
    {
        emit_segment(points.back(), points.front(), width, rgba);
    }
}

void Canvas::blit(const rendering::Surface& surface, Rect dest)
{
    const i32 x0 = std::max(dest.x, 0);
    const i32 y0 = std::max(dest.y, 0);
    const i32 x1 = std::min(dest.x + dest.width, static_cast<i32>(m_extent.width));
    const i32 y1 = std::min(dest.y + dest.height, static_cast<i32>(m_extent.height));
    if (x1 <= x0 || y1 <= y0 || surface.empty())
    {
        return;
    }

    const VkRect2D full = m_scissor;

    VkRect2D clip{};
    clip.offset = {x0, y0};
    clip.extent = {static_cast<uint32_t>(x1 - x0), static_cast<uint32_t>(y1 - y0)};
    set_scissor(clip);

    const Vec2d offset{static_cast<f64>(dest.x), static_cast<f64>(dest.y)};
    for (const auto& primitive : surface.primitives())
    {
        emit_primitive(primitive, offset);
    }

    set_scissor(full);
}

rendering::Surface Canvas::text_to_surface(std::string_view text, Color color)
{
    return m_font.render(text, color);
}

// =================================================================
// Tessellation
// =================================================================

void Canvas::set_scissor(const VkRect2D& scissor)
{
    m_scissor = scissor;

    if (!m_batches.empty() && same_rect(m_batches.back().scissor, scissor))
    {
        return;
    }
    if (!m_batches.empty() && m_batches.back().vertex_count == 0)
    {
        m_batches.back().scissor = scissor;
        return;
    }

    m_batches.push_back(DrawBatch{
        .scissor = scissor,
        .first_vertex = static_cast<u32>(m_vertices.size()),
        .vertex_count = 0,
    });
}

void Canvas::push_triangle(Vec2d a, Vec2d b, Vec2d c, const Vec4f& color)
{
    if (m_vertices.size() + 3 > m_capacity)
    {
        if (!m_overflow_reported)
        {
            ORR_CORE_WARN("Canvas vertex buffer full ({} vertices), dropping geometry", m_capacity);
            m_overflow_reported = true;
        }
        return;
    }

    for (const Vec2d& p : {a, b, c})
    {
        m_vertices.push_back(CanvasVertex{
            .position = Vec2f{static_cast<f32>(p.x), static_cast<f32>(p.y)},
            .padding = Vec2f{0.0f, 0.0f},
            .color = color,
        });
    }
    m_batches.back().vertex_count += 3;
}

void Canvas::emit_disk(Vec2d center, f64 radius, const Vec4f& color)
{
    if (radius <= 0.0)
    {
        return;
    }

    const i32 segments = std::clamp(static_cast<i32>(radius * 2.0), kMinDiskSegments, kMaxDiskSegments);
    const f64 step = math_constants::kTwoPi / segments;

    Vec2d previous = center + Vec2d{radius, 0.0};
    for (i32 i = 1; i <= segments; ++i)
    {
        const f64 angle = step * i;
        const Vec2d current = center + Vec2d{radius * std::cos(angle), radius * std::sin(angle)};
        push_triangle(center, previous, current, color);
        previous = current;
    }
}

void Canvas::emit_segment(Vec2d from, Vec2d to, f64 width, const Vec4f& color)
{
    const Vec2d direction = to - from;
    const f64 length = glm::length(direction);
    if (length < 1e-9)
    {
        return;
    }

    const Vec2d normal = Vec2d{-direction.y, direction.x} * (0.5 * std::max(width, 1.0) / length);
    const Vec2d a = from + normal;
    const Vec2d b = from - normal;
    const Vec2d c = to - normal;
    const Vec2d d = to + normal;

    push_triangle(a, b, c, color);
    push_triangle(a, c, d, color);
}

void Canvas::emit_rect(const Rect& rect, const Vec4f& color)
{
    const Vec2d top_left{static_cast<f64>(rect.x), static_cast<f64>(rect.y)};
    const Vec2d bottom_right{static_cast<f64>(rect.x + rect.width), static_cast<f64>(rect.y + rect.height)};
    const Vec2d top_right{bottom_right.x, top_left.y};
    const Vec2d bottom_left{top_left.x, bottom_right.y};

    push_triangle(top_left, top_right, bottom_right, color);
    push_triangle(top_left, bottom_right, bottom_left, color);
}

void Canvas::emit_primitive(const rendering::Primitive& primitive, Vec2d offset)
{
    std::visit(
        [this, offset](const auto& p) {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, rendering::LinePrimitive>)
            {
                emit_segment(p.from + offset, p.to + offset, p.width, p.color.to_vec4());
            }
            else if constexpr (std::is_same_v<T, rendering::PolylinePrimitive>)
            {
                std::vector<Vec2d> moved(p.points);
                for (Vec2d& point : moved)
                {
                    point += offset;
                }
                draw_polyline(moved, p.closed, p.color, p.width);
            }
            else if constexpr (std::is_same_v<T, rendering::RectPrimitive>)
            {
                Rect moved = p.rect;
                moved.x += static_cast<i32>(offset.x);
                moved.y += static_cast<i32>(offset.y);
                emit_rect(moved, p.color.to_vec4());
            }
            else
            {
                emit_disk(p.center + offset, p.radius, p.color.to_vec4());
            }
        },
        primitive);
}

// =================================================================
// GPU resources
// =================================================================

void Canvas::create_frame_buffers(u32 frames_in_flight)
{
    VkDevice device = m_context.get_device();
    const VkDeviceSize size = sizeof(CanvasVertex) * static_cast<VkDeviceSize>(m_capacity);

    m_frames.resize(frames_in_flight);

    std::vector<VkDescriptorSetLayout> layouts(frames_in_flight, m_descriptor_set_layout);
    std::vector<VkDescriptorSet> sets(frames_in_flight, VK_NULL_HANDLE);

    VkDescriptorSetAllocateInfo set_info{};
    set_info.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
    set_info.descriptorPool = m_descriptor_pool;
    set_info.descriptorSetCount = frames_in_flight;
    set_info.pSetLayouts = layouts.data();

    check_vk(vkAllocateDescriptorSets(device, &set_info, sets.data()), "vkAllocateDescriptorSets (canvas)");

    for (u32 i = 0; i < frames_in_flight; ++i)
    {
        FrameBuffer& frame = m_frames[i];
        frame.descriptor_set = sets[i];

        VkBufferCreateInfo buffer_info{};
        buffer_info.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
        buffer_info.size = size;
        buffer_info.usage = VK_BUFFER_USAGE_STORAGE_BUFFER_BIT;
        buffer_info.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

        check_vk(vkCreateBuffer(device, &buffer_info, nullptr, &frame.buffer), "vkCreateBuffer (canvas)");

        VkMemoryRequirements requirements{};
        vkGetBufferMemoryRequirements(device, frame.buffer, &requirements);

        VkMemoryAllocateInfo alloc_info{};
        alloc_info.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
        alloc_info.allocationSize = requirements.size;
        alloc_info.memoryTypeIndex = m_context.find_memory_type(
            requirements.memoryTypeBits,
            VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT);

        check_vk(vkAllocateMemory(device, &alloc_info, nullptr, &frame.memory), "vkAllocateMemory (canvas)");
        check_vk(vkBindBufferMemory(device, frame.buffer, frame.memory, 0), "vkBindBufferMemory (canvas)");
        check_vk(vkMapMemory(device, frame.memory, 0, size, 0, &frame.mapped), "vkMapMemory (canvas)");

        VkDescriptorBufferInfo buffer_desc{};
        buffer_desc.buffer = frame.buffer;
        buffer_desc.range = VK_WHOLE_SIZE;

        VkWriteDescriptorSet write{};
        write.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
        write.dstSet = frame.descriptor_set;
        write.dstBinding = 0;
        write.descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
        write.descriptorCount = 1;
        write.pBufferInfo = &buffer_desc;

        vkUpdateDescriptorSets(device, 1, &write, 0, nullptr);
    }
}

// -----------------------------------------------------------------
// One storage buffer at binding 0, one set per frame slot
// -----------------------------------------------------------------
void Canvas::create_descriptors()
{
    VkDevice device = m_context.get_device();

    VkDescriptorSetLayoutBinding binding{};
    binding.binding = 0;
    binding.descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
    binding.descriptorCount = 1;
    binding.stageFlags = VK_SHADER_STAGE_VERTEX_BIT;

    VkDescriptorSetLayoutCreateInfo layout_info{};
    layout_info.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
    layout_info.bindingCount = 1;
    layout_info.pBindings = &binding;

    check_vk(vkCreateDescriptorSetLayout(device, &layout_info, nullptr, &m_descriptor_set_layout),
             "vkCreateDescriptorSetLayout (canvas)");

    // Sized generously so the frame count can grow without touching this.
    constexpr u32 kMaxSets = 8;

    VkDescriptorPoolSize pool_size{};
    pool_size.type = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
    pool_size.descriptorCount = kMaxSets;

    VkDescriptorPoolCreateInfo pool_info{};
    pool_info.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    pool_info.poolSizeCount = 1;
    pool_info.pPoolSizes = &pool_size;
    pool_info.maxSets = kMaxSets;

    check_vk(vkCreateDescriptorPool(device, &pool_info, nullptr, &m_descriptor_pool),
             "vkCreateDescriptorPool (canvas)");
}

// -----------------------------------------------------------------
// TRIANGLE_LIST, source-over alpha blending, dynamic viewport/scissor
// -----------------------------------------------------------------
void Canvas::create_pipeline(VkRenderPass render_pass, const std::filesystem::path& shader_dir)
{
    VkDevice device = m_context.get_device();

    VkShaderModule vert_module = m_context.create_shader_module(shader_dir / "canvas.vert.spv");
    VkShaderModule frag_module = m_context.create_shader_module(shader_dir / "canvas.frag.spv");

    VkPipelineShaderStageCreateInfo stages[2]{};
    stages[0].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    stages[0].stage = VK_SHADER_STAGE_VERTEX_BIT;
    stages[0].module = vert_module;
    stages[0].pName = "main";
    stages[1].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    stages[1].stage = VK_SHADER_STAGE_FRAGMENT_BIT;
    stages[1].module = frag_module;
    stages[1].pName = "main";

    // Vertices are pulled from the storage buffer by gl_VertexIndex.
    VkPipelineVertexInputStateCreateInfo vertex_input{};
    vertex_input.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;

    VkPipelineInputAssemblyStateCreateInfo input_assembly{};
    input_assembly.sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
    input_assembly.topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;

    VkDynamicState dynamic_states[] = {VK_DYNAMIC_STATE_VIEWPORT, VK_DYNAMIC_STATE_SCISSOR};

    VkPipelineDynamicStateCreateInfo dynamic_state{};
    dynamic_state.sType = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
    dynamic_state.dynamicStateCount = 2;
    dynamic_state.pDynamicStates = dynamic_states;

    VkPipelineViewportStateCreateInfo viewport_state{};
    viewport_state.sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
    viewport_state.viewportCount = 1;
    viewport_state.scissorCount = 1;

    VkPipelineRasterizationStateCreateInfo rasterizer{};
    rasterizer.sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
    rasterizer.polygonMode = VK_POLYGON_MODE_FILL;
    rasterizer.cullMode = VK_CULL_MODE_NONE;
    rasterizer.frontFace = VK_FRONT_FACE_CLOCKWISE;
    rasterizer.lineWidth = 1.0f;

    VkPipelineMultisampleStateCreateInfo multisampling{};
    multisampling.sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
    multisampling.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;

    VkPipelineColorBlendAttachmentState blend{};
    blend.colorWriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT
                         | VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;
    blend.blendEnable = VK_TRUE;
    blend.srcColorBlendFactor = VK_BLEND_FACTOR_SRC_ALPHA;
    blend.dstColorBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
    blend.colorBlendOp = VK_BLEND_OP_ADD;
    blend.srcAlphaBlendFactor = VK_BLEND_FACTOR_ONE;
    blend.dstAlphaBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
    blend.alphaBlendOp = VK_BLEND_OP_ADD;

    VkPipelineColorBlendStateCreateInfo color_blending{};
    color_blending.sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
    color_blending.attachmentCount = 1;
    color_blending.pAttachments = &blend;

    VkPushConstantRange push_range{};
    push_range.stageFlags = VK_SHADER_STAGE_VERTEX_BIT;
    push_range.size = sizeof(CanvasPushConstants);

    VkPipelineLayoutCreateInfo layout_info{};
    layout_info.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
    layout_info.setLayoutCount = 1;
    layout_info.pSetLayouts = &m_descriptor_set_layout;
    layout_info.pushConstantRangeCount = 1;
    layout_info.pPushConstantRanges = &push_range;

    check_vk(vkCreatePipelineLayout(device, &layout_info, nullptr, &m_pipeline_layout),
             "vkCreatePipelineLayout (canvas)");

    VkGraphicsPipelineCreateInfo pipeline_info{};
    pipeline_info.sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
    pipeline_info.stageCount = 2;
    pipeline_info.pStages = stages;
    pipeline_info.pVertexInputState = &vertex_input;
    pipeline_info.pInputAssemblyState = &input_assembly;
    pipeline_info.pViewportState = &viewport_state;
    pipeline_info.pRasterizationState = &rasterizer;
    pipeline_info.pMultisampleState = &multisampling;
    pipeline_info.pColorBlendState = &color_blending;
    pipeline_info.pDynamicState = &dynamic_state;
    pipeline_info.layout = m_pipeline_layout;
    pipeline_info.renderPass = render_pass;
    pipeline_info.subpass = 0;

    check_vk(vkCreateGraphicsPipelines(device, VK_NULL_HANDLE, 1, &pipeline_info, nullptr, &m_pipeline),
             "vkCreateGraphicsPipelines (canvas)");

    vkDestroyShaderModule(device, frag_module, nullptr);
    vkDestroyShaderModule(device, vert_module, nullptr);
}

} // namespace orrery::vulkan
