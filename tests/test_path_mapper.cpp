#include <gtest/gtest.h>

#include "path_mapper.hpp"

TEST(PathMapperTest, NoMappingsMeansNotFound)
{
    EXPECT_FALSE(PathMapper::resolve("/a/b.mp4", {}).has_value());
}

TEST(PathMapperTest, ReplacesMatchingPrefix)
{
    auto local = PathMapper::resolve("/a/b.mp4", {{"/a", "/data/a"}});

    ASSERT_TRUE(local.has_value());
    EXPECT_EQ(local->string(), "/data/a/b.mp4");
}

TEST(PathMapperTest, UnmatchedPathIsNotFound)
{
    std::vector<PathMapping> mappings{{"/tv", "/srv/tv"}, {"/movies", "/srv/movies"}};

    EXPECT_FALSE(PathMapper::resolve("/music/song.flac", mappings).has_value());
    EXPECT_FALSE(PathMapper::resolve("/t", mappings).has_value());
}

TEST(PathMapperTest, LastMatchInDeclaredOrderWins)
{
    std::vector<PathMapping> generalFirst{{"/tv", "/a"}, {"/tv/shows", "/b"}};
    std::vector<PathMapping> specificFirst{{"/tv/shows", "/b"}, {"/tv", "/a"}};

    EXPECT_EQ(PathMapper::resolve("/tv/shows/x.mkv", generalFirst).value().string(), "/b/x.mkv");
    EXPECT_EQ(PathMapper::resolve("/tv/shows/x.mkv", specificFirst).value().string(), "/a/shows/x.mkv");
}

TEST(PathMapperTest, EarlierMatchSurvivesLaterMiss)
{
    std::vector<PathMapping> mappings{{"/tv", "/a"}, {"/movies", "/b"}};

    EXPECT_EQ(PathMapper::resolve("/tv/x.mkv", mappings).value().string(), "/a/x.mkv");
}

TEST(PathMapperTest, OnlyLeadingPrefixIsReplaced)
{
    auto local = PathMapper::resolve("/a/x/a/y.mp4", {{"/a", "/L"}});

    ASSERT_TRUE(local.has_value());
    EXPECT_EQ(local->string(), "/L/x/a/y.mp4");
}

TEST(PathMapperTest, EmptyRemotePrefixMatchesEverything)
{
    auto local = PathMapper::resolve("/x/y.mp4", {{"", "/srv/all"}});

    ASSERT_TRUE(local.has_value());
    EXPECT_EQ(local->string(), "/srv/all/x/y.mp4");
}

TEST(PathMapperTest, ResultIsNormalised)
{
    auto local = PathMapper::resolve("/a/b.mp4", {{"/a", "/data/./a/"}});

    ASSERT_TRUE(local.has_value());
    EXPECT_EQ(local->string(), "/data/a/b.mp4");
}
