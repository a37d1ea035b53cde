#include <trialrun/trialrun.hpp>

#include <cmath>
#include <cstddef>
#include <functional>
#include <numbers>
#include <string>

FILE_METADATA(Tags{"numerics"})

namespace {

constexpr std::string_view MODULE = "integrator";

/// Composite trapezoidal rule over [lo, hi], recording which of its own lines and branches ran
double trapezoid(const std::function<double(double)>& fn, double lo, double hi, std::size_t steps,
                 trialrun::CoverageSample& coverage) {
    coverage.declare(MODULE, 1);
    coverage.declare(MODULE, 2, /*num_branches=*/1);
    coverage.declare(MODULE, 3);
    coverage.declare(MODULE, 4, /*num_branches=*/1);
    coverage.declare(MODULE, 5);

    coverage.hit(MODULE, 1);

    const bool degenerate = steps == 0 || lo == hi;
    coverage.hit(MODULE, 2);
    coverage.branch(MODULE, 2, 0, degenerate);

    if (degenerate) {
        coverage.hit(MODULE, 3);
        return 0.0;
    }

    const double width = (hi - lo) / static_cast<double>(steps);
    double sum = (fn(lo) + fn(hi)) / 2;

    for (std::size_t i = 1; i < steps; ++i) {
        sum += fn(lo + (static_cast<double>(i) * width));
    }

    const bool reversed = hi < lo;
    coverage.hit(MODULE, 4);
    coverage.branch(MODULE, 4, 0, reversed);

    coverage.hit(MODULE, 5);
    return sum * width;
}

} // namespace

UNIT("test_sine_area", Params{{"steps", "1000"}, {"tolerance", "1e-5"}}) {
    const auto steps = ctx.param<std::size_t>("steps");
    const auto tolerance = ctx.param<double>("tolerance");

    const double area = trapezoid([](double x) { return std::sin(x); }, 0.0, std::numbers::pi, steps, ctx.coverage());

    ctx.inspect(area);
    EXPECT_NEAR(area, 2.0, tolerance, "area under sin on [0, pi]");

    if (ctx.do_plot()) {
        auto& samples = ctx.artifact("sine.csv");
        const double width = std::numbers::pi / static_cast<double>(steps);

        for (std::size_t i = 0; i <= steps; ++i) {
            const double x = static_cast<double>(i) * width;
            TRY_OR_THROW(samples.write(fmt::format("{},{}\n", x, std::sin(x))), "writing plot samples");
        }

        ctx.note(fmt::format("plot samples written for backend {}", ctx.plot_backend().value_or("<default>")));
    }
}

UNIT("test_reversed_bounds", Tags{"numerics", "edge"}) {
    const double forward = trapezoid([](double x) { return x * x; }, 0.0, 3.0, 300, ctx.coverage());
    const double backward = trapezoid([](double x) { return x * x; }, 3.0, 0.0, 300, ctx.coverage());

    EXPECT_NEAR(forward, 9.0, 1e-3);
    EXPECT_NEAR(backward, -forward, 1e-9, "reversing the bounds negates the integral");
}

UNIT("test_degenerate_interval", Timeout{std::chrono::seconds{5}}) {
    EXPECT_EQ(trapezoid([](double x) { return x; }, 1.0, 1.0, 100, ctx.coverage()), 0.0);
    EXPECT_EQ(trapezoid([](double x) { return x; }, 0.0, 1.0, 0, ctx.coverage()), 0.0, "zero steps");

    if (ctx.verbose()) {
        ctx.note("degenerate intervals integrate to zero");
    }
}
