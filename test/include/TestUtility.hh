#ifndef TESTUTILITY_HH_
#define TESTUTILITY_HH_

#include "engine/EngineFailure.hh"

#include <gtest/gtest.h>

#include <ranges>
#include <vector>

namespace Uno {

// Needed to work around some googlemock matchers not working with native ranges
// (https://github.com/google/googletest/issues/3564)
template<std::ranges::view View>
auto vectorize(View v)
{
    auto ret = std::vector<std::ranges::range_value_t<View>> {};
    for (auto&& element : v) {
        ret.emplace_back(element);
    }
    return ret;
}

template<typename Function>
void expectFailure(Engine::EngineFailure::Kind kind, Function&& function)
{
    try {
        function();
        ADD_FAILURE() << "Expected failure: " << kind;
    } catch (const Engine::EngineFailure& e) {
        EXPECT_EQ(kind, e.getKind()) << e.what();
    }
}

}

#endif // TESTUTILITY_HH_
