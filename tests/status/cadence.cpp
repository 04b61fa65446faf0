#include <vigil/status/cadence.hpp>

#include <vigil/utilities/errors.h>
#include <vigil/utilities/testing.h>

using namespace vigil;

typedef std::chrono::milliseconds ms;

TEST_CASE("fixed cadence", "[status][cadence]")
{
    fixed_cadence cadence;
    for (unsigned attempt = 0; attempt != 5; ++attempt)
        REQUIRE(cadence.interval(attempt, ms(90)) == ms(90));
}

TEST_CASE("exponential backoff cadence", "[status][cadence]")
{
    exponential_backoff_cadence cadence(2, ms(1000));
    REQUIRE(cadence.interval(0, ms(100)) == ms(100));
    REQUIRE(cadence.interval(1, ms(100)) == ms(200));
    REQUIRE(cadence.interval(3, ms(100)) == ms(800));
    REQUIRE(cadence.interval(4, ms(100)) == ms(1000));
    REQUIRE(cadence.interval(4000, ms(100)) == ms(1000));

    exponential_backoff_cadence flat(1, ms(1000));
    REQUIRE(flat.interval(10, ms(100)) == ms(100));

    exponential_backoff_cadence fractional(1.5, ms(1000));
    REQUIRE(fractional.interval(1, ms(10)) == ms(15));
}

TEST_CASE("exponential backoff validation", "[status][cadence]")
{
    try
    {
        exponential_backoff_cadence cadence(0.5, ms(1000));
        FAIL("no exception thrown");
    }
    catch (configuration_error& e)
    {
        REQUIRE(
            get_required_error_info<invalid_option_info>(e)
            == "backoff factor");
    }
    REQUIRE_THROWS_AS(
        exponential_backoff_cadence(2, ms(0)), configuration_error);
}

TEST_CASE("jittered cadence", "[status][cadence]")
{
    auto base = std::make_shared<fixed_cadence>();
    jittered_cadence cadence(base, ms(20), 17);
    for (unsigned attempt = 0; attempt != 100; ++attempt)
    {
        auto interval = cadence.interval(attempt, ms(100));
        REQUIRE(interval >= ms(100));
        REQUIRE(interval <= ms(120));
    }

    // Equal seeds give equal sequences.
    jittered_cadence a(base, ms(50), 3);
    jittered_cadence b(base, ms(50), 3);
    for (unsigned attempt = 0; attempt != 10; ++attempt)
    {
        REQUIRE(
            a.interval(attempt, ms(10))
            == b.interval(attempt, ms(10)));
    }

    jittered_cadence none_added(base, ms(0));
    REQUIRE(none_added.interval(0, ms(10)) == ms(10));

    REQUIRE_THROWS_AS(
        jittered_cadence(nullptr, ms(5)), configuration_error);
    REQUIRE_THROWS_AS(
        jittered_cadence(base, ms(-5)), configuration_error);
}
