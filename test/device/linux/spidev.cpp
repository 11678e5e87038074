#include <catch2/catch.hpp>

#include <tmp12x/device/linux/spidev.hpp>
#include <tmp12x/driver.hpp>

#include <cerrno>
#include <system_error>

using namespace tmp12x;
using tmp12x::dev::linux_host::spidev;

static spidev::config missing_device() {
  spidev::config cfg;
  cfg.path = "/nonexistent/spidev9.9";
  return cfg;
}

TEST_CASE("spidev init fails for a missing device node", "[spidev]") {
  spidev dev{missing_device()};
  auto r = dev.init();
  REQUIRE(not r);
  CHECK(r.error() == std::errc::no_such_file_or_directory);
  CHECK(not dev.is_open());
}

TEST_CASE("spidev init closes the node when it is not an spi device", "[spidev]") {
  // /dev/null opens fine but rejects the spidev ioctls
  spidev::config cfg;
  cfg.path = "/dev/null";
  spidev dev{cfg};

  auto r = dev.init();
  REQUIRE(not r);
  CHECK(r.error() == std::error_code(ENOTTY, std::system_category()));
  CHECK(not dev.is_open());

  unsigned char data[2] = {};
  auto read = dev.read(data, 2);
  REQUIRE(not read);
  CHECK(read.error() == std::errc::bad_file_descriptor);
}

TEST_CASE("spidev read before init reports a bad descriptor", "[spidev]") {
  spidev dev{missing_device()};
  unsigned char data[2] = {};
  auto r = dev.read(data, 2);
  REQUIRE(not r);
  CHECK(r.error() == std::errc::bad_file_descriptor);
}

TEST_CASE("spidev keeps its configuration across moves", "[spidev]") {
  spidev::config cfg = missing_device();
  cfg.speed_hz = 500'000;
  cfg.mode = 1;

  spidev a{cfg};
  spidev b{std::move(a)};
  CHECK(b.configuration().path == "/nonexistent/spidev9.9");
  CHECK(b.configuration().speed_hz == 500'000);
  CHECK(b.configuration().mode == 1);
  CHECK(not b.is_open());
}

TEST_CASE("driver creation surfaces spidev open errors", "[spidev][driver]") {
  auto sensor = driver<spidev, standard_profile>::create(spidev{missing_device()});
  REQUIRE(not sensor);
  CHECK(sensor.error().kind == error_kind::transport_failure);
  REQUIRE(sensor.error().transport.has_value());
  CHECK(*sensor.error().transport == std::errc::no_such_file_or_directory);
}
