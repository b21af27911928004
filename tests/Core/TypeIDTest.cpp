#include <gtest/gtest.h>
#include "Strata/Core/TypeID.hpp"
#include <set>

namespace
{
    struct Position { float x, y, z; };
    struct Velocity { float dx, dy, dz; };

    namespace Game
    {
        struct Player { int id; };
    }

    template<typename T>
    struct TemplatedComponent { T value; };
}

class TypeIDTest : public ::testing::Test
{
};

TEST_F(TypeIDTest, HashesAreStableAndDistinct)
{
    using namespace Strata;

    EXPECT_EQ(TypeID<Position>::Hash(), TypeID<Position>::Hash());
    EXPECT_NE(TypeID<Position>::Hash(), TypeID<Velocity>::Hash());

    std::set<std::uint64_t> hashes{
        TypeID<Position>::Hash(),
        TypeID<Velocity>::Hash(),
        TypeID<Game::Player>::Hash(),
        TypeID<TemplatedComponent<int>>::Hash(),
        TypeID<TemplatedComponent<float>>::Hash()
    };
    EXPECT_EQ(hashes.size(), 5u);
}

TEST_F(TypeIDTest, HashIsCompileTime)
{
    using namespace Strata;

    constexpr std::uint64_t hash = TypeID<Position>::Hash();
    static_assert(hash != 0);
    EXPECT_EQ(hash, Detail::HashString(TypeID<Position>::Name()));
}

TEST_F(TypeIDTest, NamesContainTypeName)
{
    using namespace Strata;

    EXPECT_NE(TypeID<Position>::Name().find("Position"), std::string_view::npos);
    EXPECT_NE(TypeID<Game::Player>::Name().find("Player"), std::string_view::npos);
    EXPECT_NE(TypeID<TemplatedComponent<int>>::Name().find("TemplatedComponent"), std::string_view::npos);
}
