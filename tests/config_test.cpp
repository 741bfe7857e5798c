#include "routelib/core/method.hpp"
#include "routelib/core/errors.hpp"

#include <gtest/gtest.h>
#include <filesystem>

using namespace routelib::core;

namespace {

    // parameter file written to the temp directory, removed by the destructor
    class TempParamFile {
        public:
            TempParamFile(const std::string &name, const std::string &content)
                : path_(std::filesystem::temp_directory_path() / name)
            {
                std::ofstream out(path_);
                out << content;
            }

            ~TempParamFile() {
                std::error_code ec;
                std::filesystem::remove(path_, ec);
            }

            std::string path() const { return path_.string(); }

        private:
            std::filesystem::path path_;
    };

}

TEST(ConfigTest, ReadsDriverParameters)
{
    TempParamFile file("routelib_params_full.yaml",
        "BEAM:\n"
        "  - [25]\n"
        "GRASP:\n"
        "  - [0.2, 0.5]\n"
        "  - [1.5]\n"
        "MMAS:\n"
        "  - [40]\n"
        "  - [2.0]\n"
        "  - [0.1]\n"
        "  - [0.01]\n"
        "  - [0.25]\n"
        "  - [0.0]\n"
        "SA:\n"
        "  - [12.5]\n");

    TDriverParams p = LoadDriverParams(file.path(), "waste");

    EXPECT_EQ(p.beamWidth, 25);
    EXPECT_DOUBLE_EQ(p.graspAlpha, 0.2);
    EXPECT_DOUBLE_EQ(p.graspLsBudget, 1.5);
    EXPECT_EQ(p.mmasAnts, 40);
    EXPECT_DOUBLE_EQ(p.mmasBeta, 2.0);
    EXPECT_DOUBLE_EQ(p.mmasRho, 0.1);
    EXPECT_DOUBLE_EQ(p.mmasTauMax, 0.01);
    EXPECT_DOUBLE_EQ(p.mmasGlobalRatio, 0.25);
    EXPECT_DOUBLE_EQ(p.saTemperature, 12.5);
}

TEST(ConfigTest, MissingMethodsKeepDefaults)
{
    TempParamFile file("routelib_params_partial.yaml", "ILS:\n  - [7]\n");

    TDriverParams p = LoadDriverParams(file.path(), "waste");
    TDriverParams defaults;

    EXPECT_EQ(p.ilsKick, 7);
    EXPECT_EQ(p.beamWidth, defaults.beamWidth);
    EXPECT_EQ(p.asAnts, defaults.asAnts);
    EXPECT_DOUBLE_EQ(p.asRho, defaults.asRho);
    EXPECT_DOUBLE_EQ(p.asTau0, 1.0 / 3000.0);
    EXPECT_DOUBLE_EQ(p.saTemperature, 30.0);
}

TEST(ConfigTest, DefaultsDependOnTheProblemVariant)
{
    TDriverParams waste = DefaultDriverParams("waste");
    EXPECT_DOUBLE_EQ(waste.graspLsBudget, 0.0);
    EXPECT_DOUBLE_EQ(waste.asLsBudget, 0.0);
    EXPECT_DOUBLE_EQ(waste.mmasRho, 0.02);
    EXPECT_DOUBLE_EQ(waste.mmasGlobalRatio, 0.5);
    EXPECT_DOUBLE_EQ(waste.saTemperature, 30.0);

    TDriverParams tsp = DefaultDriverParams("tsp");
    EXPECT_DOUBLE_EQ(tsp.graspAlpha, 0.01);
    EXPECT_DOUBLE_EQ(tsp.graspLsBudget, 0.1);
    EXPECT_DOUBLE_EQ(tsp.asRho, 0.5);
    EXPECT_DOUBLE_EQ(tsp.asLsBudget, 1.0);
    EXPECT_DOUBLE_EQ(tsp.mmasRho, 0.05);
    EXPECT_DOUBLE_EQ(tsp.mmasGlobalRatio, 0.1);
    EXPECT_DOUBLE_EQ(tsp.mmasLsBudget, 1.0);
    EXPECT_DOUBLE_EQ(tsp.saTemperature, 10.0);
    EXPECT_EQ(tsp.beamWidth, 10);
}

TEST(ConfigTest, VariantSectionOverridesTopLevel)
{
    TempParamFile file("routelib_params_sections.yaml",
        "BEAM:\n"
        "  - [12]\n"
        "SA:\n"
        "  - [30.0]\n"
        "tsp:\n"
        "  SA:\n"
        "    - [7.5]\n"
        "waste:\n"
        "  ILS:\n"
        "    - [5]\n");

    TDriverParams tsp = LoadDriverParams(file.path(), "tsp");
    EXPECT_EQ(tsp.beamWidth, 12);
    EXPECT_DOUBLE_EQ(tsp.saTemperature, 7.5);
    EXPECT_EQ(tsp.ilsKick, 3);
    EXPECT_DOUBLE_EQ(tsp.mmasRho, 0.05);

    TDriverParams waste = LoadDriverParams(file.path(), "waste");
    EXPECT_EQ(waste.beamWidth, 12);
    EXPECT_DOUBLE_EQ(waste.saTemperature, 30.0);
    EXPECT_EQ(waste.ilsKick, 5);
    EXPECT_DOUBLE_EQ(waste.mmasRho, 0.02);

    TempParamFile scalar("routelib_params_bad_section.yaml", "tsp: 3\n");
    EXPECT_THROW(LoadDriverParams(scalar.path(), "tsp"), ConfigError);
    EXPECT_NO_THROW(LoadDriverParams(scalar.path(), "waste"));
}

TEST(ConfigTest, ReadParametersFillsEveryList)
{
    TempParamFile file("routelib_params_lists.yaml", "AS:\n  - [1, 2, 3]\n  - []\n  - [4]\n");

    std::vector<std::vector<double>> parameters;
    readParametersYaml(file.path(), "AS", parameters, 4);

    ASSERT_EQ(parameters.size(), 4u);
    EXPECT_EQ(parameters[0], (std::vector<double>{1, 2, 3}));
    EXPECT_TRUE(parameters[1].empty());
    EXPECT_EQ(parameters[2], (std::vector<double>{4}));
    EXPECT_TRUE(parameters[3].empty());
}

TEST(ConfigTest, MalformedFilesAreConfigErrors)
{
    TempParamFile syntax("routelib_params_syntax.yaml", "BEAM: [[1\n");
    EXPECT_THROW(LoadDriverParams(syntax.path(), "waste"), ConfigError);

    TempParamFile notList("routelib_params_scalar.yaml", "BEAM: 10\n");
    EXPECT_THROW(LoadDriverParams(notList.path(), "waste"), ConfigError);

    TempParamFile text("routelib_params_text.yaml", "SA:\n  - [hot]\n");
    EXPECT_THROW(LoadDriverParams(text.path(), "waste"), ConfigError);

    EXPECT_THROW(LoadDriverParams("/nonexistent/routelib/params.yaml", "waste"), ConfigError);
}

TEST(ConfigTest, RejectsOutOfRangeValues)
{
    TempParamFile width("routelib_params_width.yaml", "BEAM:\n  - [0]\n");
    EXPECT_THROW(LoadDriverParams(width.path(), "waste"), ConfigError);

    TempParamFile rho("routelib_params_rho.yaml", "AS:\n  - [10]\n  - [5]\n  - [1.5]\n");
    EXPECT_THROW(LoadDriverParams(rho.path(), "waste"), ConfigError);
}

TEST(ConfigTest, ParsesLogLevels)
{
    EXPECT_EQ(parseLogLevel("critical"), LogLevel::Critical);
    EXPECT_EQ(parseLogLevel("info"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_THROW(parseLogLevel("verbose"), ConfigError);
}

TEST(ConfigTest, LogMessageFormatAndLevelGate)
{
    std::ostringstream log;
    SearchContext ctx(1, log, LogLevel::Info);

    LogMessage(ctx, LogLevel::Debug, "hidden");
    EXPECT_TRUE(log.str().empty());

    LogMessage(ctx, LogLevel::Info, "Objective: 4.000");
    std::string line = log.str();

    ASSERT_EQ(line.rfind("INFO;", 0), 0u) << line;
    EXPECT_NE(line.find(";Objective: 4.000\n"), std::string::npos) << line;

    // LEVEL;YYYY-MM-DD HH:MM:SS;message
    std::size_t first = line.find(';');
    std::size_t second = line.find(';', first + 1);
    EXPECT_EQ(second - first - 1, 19u);
}

TEST(ConfigTest, ContextGeneratorIsReproducible)
{
    SearchContext a(99);
    SearchContext b(99);
    EXPECT_EQ(a.getRng()(), b.getRng()());

    a.signalStop();
    EXPECT_TRUE(a.shouldStop());
    a.resetStopFlag();
    EXPECT_FALSE(a.shouldStop());
}

TEST(ConfigTest, TimeBudgetAndPermutation)
{
    TimeBudget zero(0.0);
    EXPECT_TRUE(zero.expired());
    EXPECT_DOUBLE_EQ(zero.fraction(), 1.0);

    TimeBudget hour(3600.0);
    EXPECT_FALSE(hour.expired());
    EXPECT_GT(hour.remaining(), 3500.0);

    std::mt19937 rng(5);
    LazyPermutation perm(50);
    std::set<std::size_t> seen;
    while (std::optional<std::size_t> k = perm.next(rng)) {
        EXPECT_LT(*k, 50u);
        seen.insert(*k);
    }
    EXPECT_EQ(seen.size(), 50u);
}
