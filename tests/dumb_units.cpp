#include <trialrun/trialrun.hpp>

FILE_METADATA(Tags{"dumb"})

UNIT("test_dumb_passes") {
    EXPECT(1 + 1 == 2);
}

UNIT("test_dumb_fails", Tags{"dumb", "failing"}) {
    EXPECT_EQ(2 + 2, 5, "arithmetic still works");
}

UNIT("dumb_without_discriminator") {
    EXPECT(false, "never discovered");
}

UNIT("test_dumb_elsewhere", Topic{"elsewhere"}) {
    ctx.note("declares a topic its file does not imply");
}
