#include <atomic> // std::atomic
#include <boost/ut.hpp>
#include <thread> // std::jthread

#include <Distro++/Utils/Lazy.hpp>
#include <Distro++/Utils/Types.hpp>

auto main() -> int {
  using namespace boost::ut;
  using namespace distro::utils;
  using namespace distro::utils::types;

  "value is computed on first access only"_test = [] -> void {
    Lazy<String> lazy;
    i32          calls = 0;

    expect(!lazy.isComputed());

    const String& first  = lazy.getOrCompute([&calls] { ++calls; return String("centos"); });
    const String& second = lazy.getOrCompute([&calls] { ++calls; return String("fedora"); });

    expect(calls == 1);
    expect(lazy.isComputed());
    expect(first == String("centos"));
    expect(&first == &second);
  };

  "concurrent first access computes once"_test = [] -> void {
    Lazy<Map<String, String>> lazy;
    std::atomic<i32>          calls { 0 };

    {
      Vec<std::jthread> threads;

      for (i32 i = 0; i < 8; ++i)
        threads.emplace_back([&lazy, &calls] {
          static_cast<void>(lazy.getOrCompute([&calls] {
            ++calls;
            return Map<String, String> { { "id", "arch" } };
          }));
        });
    }

    expect(calls.load() == 1);
    expect(lazy.getOrCompute([] { return Map<String, String> {}; }).at("id") == String("arch"));
  };

  return 0;
}
