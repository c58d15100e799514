#include <atomic>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

#include "gpurt/core/context.hpp"
#include "gpurt/core/log.hpp"
#include "gpurt/core/result.hpp"
#include "gpurt/core/time.hpp"
#include "gpurt/job/job_system.hpp"
#include "gpurt/job/parallel_for.hpp"
#include "gpurt/job/thread_pool_job_system.hpp"
#include "gpurt/job/wait_group.hpp"
#include "gpurt/render/storage_target.hpp"
#include "gpurt/rhi/core/capabilities.hpp"
#include "gpurt/rhi/drivers/software/sw_backend.hpp"
#include "gpurt/rhi/drivers/vulkan/vk_frame_ownership.hpp"

namespace
{
    bool approx_eq(float a, float b, float eps = 1e-4f)
    {
        return std::abs(a - b) <= eps;
    }

    struct DummyBackend final : gpurt::IRenderBackend
    {
        explicit DummyBackend(gpurt::RenderBackendType t)
            : type_(t)
        {}

        gpurt::RenderBackendType type() const override { return type_; }
        void begin_frame(gpurt::Context&, const gpurt::RenderBackendFrameInfo&) override { ++begin_count; }
        void end_frame(gpurt::Context&, const gpurt::RenderBackendFrameInfo&) override { ++end_count; }

        gpurt::RenderBackendType type_ = gpurt::RenderBackendType::Software;
        int begin_count = 0;
        int end_count = 0;
    };

    bool test_context_backend_registry()
    {
        gpurt::Context ctx{};
        if (ctx.active_backend() != nullptr) return false;

        gpurt::SoftwareRenderBackend sw{};
        ctx.register_backend(&sw);
        if (ctx.primary_backend != gpurt::RenderBackendType::Software) return false;

        // Asking for a missing backend falls back to what is registered.
        ctx.set_primary_backend(gpurt::RenderBackendType::Vulkan);
        if (ctx.active_backend() != &sw) return false;
        if (ctx.active_backend_type() != gpurt::RenderBackendType::Software) return false;

        DummyBackend vk{gpurt::RenderBackendType::Vulkan};
        ctx.register_backend(&vk);
        if (!ctx.has_backend(gpurt::RenderBackendType::Vulkan)) return false;
        if (ctx.active_backend() != &vk) return false;
        if (std::string(ctx.active_backend_name()) != "vulkan") return false;

        ctx.set_primary_backend(&sw);
        return ctx.active_backend() == &sw;
    }

    bool test_backend_name_parsing()
    {
        using gpurt::RenderBackendType;
        if (gpurt::try_parse_render_backend_type("VK") != RenderBackendType::Vulkan) return false;
        if (gpurt::try_parse_render_backend_type("cpu") != RenderBackendType::Software) return false;
        if (gpurt::try_parse_render_backend_type("opengl").has_value()) return false;
        if (gpurt::try_parse_present_mode_preference("Mailbox") != gpurt::PresentModePreference::Mailbox) return false;
        if (gpurt::try_parse_present_mode_preference("vsync") != gpurt::PresentModePreference::Fifo) return false;
        return !gpurt::try_parse_present_mode_preference("immediate").has_value();
    }

    bool test_frame_status_classification()
    {
        using gpurt::FrameStatus;
        if (!gpurt::frame_status_needs_resize(FrameStatus::SurfaceOutOfDate)) return false;
        if (!gpurt::frame_status_needs_resize(FrameStatus::SurfaceLost)) return false;
        if (gpurt::frame_status_needs_resize(FrameStatus::OutOfMemory)) return false;
        if (!gpurt::frame_status_is_fatal(FrameStatus::OutOfMemory)) return false;
        if (!gpurt::frame_status_is_fatal(FrameStatus::DeviceLost)) return false;
        if (gpurt::frame_status_is_fatal(FrameStatus::Error)) return false;

        gpurt::FrameStatusCounters c{};
        c.record(FrameStatus::Ok);
        c.record(FrameStatus::Ok);
        c.record(FrameStatus::Skipped);
        c.record(FrameStatus::SurfaceLost);
        c.record(FrameStatus::SurfaceOutOfDate);
        c.record(FrameStatus::Error);
        return c.ok == 2 && c.skipped == 1 && c.resized == 2 && c.errors == 1;
    }

    bool test_capabilities_gate()
    {
        gpurt::SoftwareRenderBackend sw{};
        if (!gpurt::capabilities_support_ray_trace(sw.capabilities(), 64)) return false;
        const gpurt::BackendCapabilities none{};
        if (gpurt::capabilities_support_ray_trace(none, 64)) return false;

        gpurt::BackendCapabilities small{};
        small.queues.compute_count = 1;
        small.features.compute_shaders = true;
        small.features.storage_image_rgba8 = true;
        small.limits.max_compute_workgroup_invocations = 32;
        return !gpurt::capabilities_support_ray_trace(small, 64);
    }

    bool test_software_backend_resize_tracking()
    {
        gpurt::Context ctx{};
        gpurt::SoftwareRenderBackend sw{};
        gpurt::RenderBackendFrameInfo frame{};
        frame.width = 320;
        frame.height = 200;
        sw.begin_frame(ctx, frame);
        if (!sw.in_frame()) return false;
        sw.end_frame(ctx, frame);
        sw.begin_frame(ctx, frame);
        sw.end_frame(ctx, frame);
        sw.on_resize(ctx, 0, 100);
        sw.on_resize(ctx, 640, 400);
        return sw.width() == 640 && sw.height() == 400 && sw.resize_count() == 2 &&
            sw.frames_completed() == 2 && !sw.in_frame();
    }

    bool test_frame_clock_and_fps()
    {
        gpurt::FrameClock clock{};
        clock.tick_hz = 1000.0;
        if (clock.begin_frame(100) != 0.0f) return false;
        if (!approx_eq(clock.begin_frame(116), 0.016f)) return false;

        gpurt::FpsCounter fps{};
        fps.window_seconds = 0.5f;
        if (fps.tick(0.0f)) return false;
        if (fps.tick(0.25f)) return false;
        if (!fps.tick(0.25f)) return false;
        return approx_eq(fps.fps, 4.0f) && approx_eq(fps.avg_ms, 250.0f, 1e-2f);
    }

    bool test_result_and_status()
    {
        const gpurt::Result<int> ok = gpurt::Result<int>::success(7);
        const gpurt::Result<int> bad = gpurt::Result<int>::failure("nope");
        const gpurt::Status s = gpurt::status_ok();
        return ok && ok.value == 7 && !bad && bad.error == "nope" && s.ok && s.error.empty();
    }

    bool test_thread_pool_parallel_for()
    {
        gpurt::ThreadPoolJobSystem js{4};
        if (js.worker_count() != 4) return false;

        constexpr int kCount = 1000;
        std::vector<int> hits(kCount, 0);
        std::atomic<long long> sum{0};
        gpurt::parallel_for_1d(&js, 0, kCount, 16, [&](int b, int e) {
            long long local = 0;
            for (int i = b; i < e; ++i)
            {
                ++hits[(size_t)i];
                local += i;
            }
            sum.fetch_add(local, std::memory_order_relaxed);
        });
        js.wait_idle();

        for (int h : hits)
        {
            if (h != 1) return false;
        }
        return sum.load() == 499500 && js.jobs_completed() > 0;
    }

    bool test_tiles_cover_image_once()
    {
        gpurt::InlineJobSystem js{};
        constexpr int kW = 19;
        constexpr int kH = 10;
        std::vector<int> hits((size_t)kW * kH, 0);
        int tiles = 0;
        gpurt::parallel_for_tiles_2d(&js, kW, kH, 8, 8, [&](int x0, int y0, int x1, int y1) {
            ++tiles;
            for (int y = y0; y < y1; ++y)
            {
                for (int x = x0; x < x1; ++x) ++hits[(size_t)y * kW + (size_t)x];
            }
        });
        for (int h : hits)
        {
            if (h != 1) return false;
        }
        return tiles == 6 && js.worker_count() == 1;
    }

    bool test_storage_target_rebuild_decision()
    {
        const VkExtent2D none{0, 0};
        // Minimized start: no swapchain images yet, so nothing to build.
        if (gpurt::storage_target_needs_rebuild(none, none, true)) return false;
        if (gpurt::storage_target_needs_rebuild(none, VkExtent2D{0, 600}, true)) return false;
        if (gpurt::storage_target_needs_rebuild(VkExtent2D{800, 600}, none, true)) return false;

        // First visible frame after that builds it.
        if (!gpurt::storage_target_needs_rebuild(none, VkExtent2D{800, 600}, false)) return false;
        if (gpurt::storage_target_needs_rebuild(VkExtent2D{800, 600}, VkExtent2D{800, 600}, false)) return false;
        if (!gpurt::storage_target_needs_rebuild(VkExtent2D{800, 600}, VkExtent2D{800, 601}, false)) return false;
        return gpurt::storage_target_needs_rebuild(VkExtent2D{800, 600}, VkExtent2D{800, 600}, true);
    }

    bool test_wait_group()
    {
        gpurt::WaitGroup wg{};
        wg.add(2);
        int ran = 0;
        wg.run([&]() { ++ran; });
        wg.done();
        wg.wait();
        return ran == 1;
    }

    bool test_parallel_for_rethrows_task_failure()
    {
        gpurt::ThreadPoolJobSystem js(3);
        std::atomic<int> chunks{0};
        bool rethrown = false;
        try
        {
            gpurt::parallel_for_1d(&js, 0, 64, 4, [&](int b, int) {
                chunks.fetch_add(1);
                if (b == 0) throw std::runtime_error("tile failed");
            });
        }
        catch (const std::runtime_error& e)
        {
            rethrown = std::string(e.what()) == "tile failed";
        }
        js.wait_idle();

        // The pool survives and keeps running work.
        std::atomic<int> covered{0};
        gpurt::parallel_for_1d(&js, 0, 64, 4, [&](int b, int e) { covered.fetch_add(e - b); });
        return rethrown && chunks.load() > 1 && covered.load() == 64;
    }

    bool test_log_line_format()
    {
        if (gpurt::format_log_line(gpurt::LogLevel::Info, "ready") != "[gpurt:INFO] ready") return false;
        if (gpurt::format_log_line(gpurt::LogLevel::Warn, "") != "[gpurt:WARN] ") return false;
        return std::string(gpurt::log_level_tag(gpurt::LogLevel::Error)) == "ERROR";
    }

    bool test_frame_ring_and_generation_tracker()
    {
        if (gpurt::vk_frame_slot(5, 2) != 1u) return false;
        if (gpurt::vk_frame_slot(5, 0) != 0u) return false;

        gpurt::VkFrameRing<int, 2> ring{};
        ring.at_frame(3) = 42;
        if (ring.at_slot(1) != 42) return false;
        bool threw = false;
        try
        {
            (void)ring.at_slot(2);
        }
        catch (const std::out_of_range&)
        {
            threw = true;
        }
        if (!threw) return false;

        int visited = 0;
        ring.for_each([&](uint32_t, int&) { ++visited; });
        if (visited != 2) return false;

        gpurt::VkSlotGenerationTracker<2> tracker{};
        if (!tracker.stale(0, 0)) return false;
        tracker.mark_uploaded(0, 7);
        if (tracker.stale(0, 7)) return false;
        if (!tracker.stale(1, 7)) return false;
        if (!tracker.stale(0, 8)) return false;
        if (!tracker.stale(5, 7)) return false;
        tracker.invalidate(0);
        if (!tracker.stale(0, 7)) return false;
        tracker.mark_uploaded(1, 3);
        tracker.invalidate_all();
        return tracker.stale(1, 3);
    }
}

int main()
{
    const bool ok_registry = test_context_backend_registry();
    const bool ok_names = test_backend_name_parsing();
    const bool ok_status = test_frame_status_classification();
    const bool ok_caps = test_capabilities_gate();
    const bool ok_sw = test_software_backend_resize_tracking();
    const bool ok_clock = test_frame_clock_and_fps();
    const bool ok_result = test_result_and_status();
    const bool ok_pool = test_thread_pool_parallel_for();
    const bool ok_tiles = test_tiles_cover_image_once();
    const bool ok_wg = test_wait_group();
    const bool ok_ring = test_frame_ring_and_generation_tracker();
    const bool ok_storage = test_storage_target_rebuild_decision();
    const bool ok_rethrow = test_parallel_for_rethrows_task_failure();
    const bool ok_log = test_log_line_format();

    if (!ok_registry) std::fprintf(stderr, "[core-tests] context backend registry failed\n");
    if (!ok_names) std::fprintf(stderr, "[core-tests] backend/present-mode name parsing failed\n");
    if (!ok_status) std::fprintf(stderr, "[core-tests] frame status classification failed\n");
    if (!ok_caps) std::fprintf(stderr, "[core-tests] capability gate failed\n");
    if (!ok_sw) std::fprintf(stderr, "[core-tests] software backend resize tracking failed\n");
    if (!ok_clock) std::fprintf(stderr, "[core-tests] frame clock / fps counter failed\n");
    if (!ok_result) std::fprintf(stderr, "[core-tests] result/status failed\n");
    if (!ok_pool) std::fprintf(stderr, "[core-tests] thread pool parallel_for failed\n");
    if (!ok_tiles) std::fprintf(stderr, "[core-tests] tile split coverage failed\n");
    if (!ok_wg) std::fprintf(stderr, "[core-tests] wait group failed\n");
    if (!ok_ring) std::fprintf(stderr, "[core-tests] frame ring / generation tracker failed\n");
    if (!ok_storage) std::fprintf(stderr, "[core-tests] storage target rebuild decision failed\n");
    if (!ok_rethrow) std::fprintf(stderr, "[core-tests] parallel_for task failure propagation failed\n");
    if (!ok_log) std::fprintf(stderr, "[core-tests] log line format failed\n");

    if (!(ok_registry && ok_names && ok_status && ok_caps && ok_sw && ok_clock && ok_result &&
          ok_pool && ok_tiles && ok_wg && ok_ring && ok_storage &&
          ok_rethrow && ok_log)) return 1;
    std::fprintf(stderr, "[core-tests] all tests passed\n");
    return 0;
}
