#include <gtest/gtest.h>
#include "km_la.h"
#include "km_se3.h"
#include "km_error.h"
#include <cmath>
#include <limits>
#include <random>

using namespace kmath;

class Se3Test : public ::testing::Test {
protected:
    void SetUp() override {
        LogSystem::getInstance().setConsoleOutput(false);
        LogSystem::getInstance().setLevel(LogSystem::Level::INFO);
        LogSystem::getInstance().clearRecentEntries();

        rigid = Dmat4::translation(Dvec4::direction(1.0, -2.0, 3.0)) *
                Dmat4::rotationZ(0.7) * Dmat4::rotationX(-1.2);
    }

    void TearDown() override {
        LogSystem::getInstance().clearRecentEntries();
        LogSystem::getInstance().setConsoleOutput(true);
    }

    size_t countSe3Warnings() const {
        size_t count = 0;
        for (const auto& entry : LogSystem::getInstance().getRecentEntries()) {
            if (entry.category == "SE3" && entry.level == LogSystem::Level::WARN) {
                ++count;
            }
        }
        return count;
    }

    Dmat4 rigid;
};

TEST_F(Se3Test, AcceptsRigidTransforms) {
    const Se3Report report = checkSE3(rigid);
    EXPECT_TRUE(report.isRigid());
    EXPECT_LT(report.orthonormality_error, 1e-12);
    EXPECT_LT(report.determinant_error, 1e-12);
    EXPECT_DOUBLE_EQ(report.bottom_row_error, 0.0);

    EXPECT_TRUE(isSE3(Dmat4::identity()));
    EXPECT_TRUE(Se3Check().isRigid(Dmat4::rotationY(2.0)));
}

TEST_F(Se3Test, CheckedInverseMatchesUnchecked) {
    EXPECT_EQ(invertSE3Checked(rigid), rigid.invertSE3());
    EXPECT_EQ(countSe3Warnings(), 0u);
}

TEST_F(Se3Test, AcceptsRandomRigidTransforms) {
    std::mt19937 gen(11);
    std::uniform_real_distribution<double> angle(-PI, PI);
    std::uniform_real_distribution<double> offset(-100.0, 100.0);
    const Se3Check checker;

    for (int i = 0; i < 500; ++i) {
        const Dmat4 m = Dmat4::translation(Dvec4::direction(offset(gen), offset(gen), offset(gen))) *
                        Dmat4::rotationX(angle(gen)) * Dmat4::rotationY(angle(gen)) *
                        Dmat4::rotationZ(angle(gen));
        EXPECT_TRUE(checker.isRigid(m)) << checker.check(m).describe();
    }
}

TEST_F(Se3Test, RejectsScale) {
    const Dmat4 scaled = Dmat4::scale(Dvec4(2.0, 1.0, 1.0, 1.0)) * rigid;
    const Se3Report report = checkSE3(scaled);
    EXPECT_FALSE(report.isRigid());
    EXPECT_GT(report.orthonormality_error, 0.5);
}

TEST_F(Se3Test, RejectsShear) {
    Dmat4 skewed = rigid;
    skewed(0, 1) += 0.1;
    EXPECT_FALSE(isSE3(skewed));
}

TEST_F(Se3Test, RejectsReflection) {
    const Dmat4 mirror = Dmat4::scale(Dvec4(-1.0, 1.0, 1.0, 1.0));
    const Se3Report report = checkSE3(mirror);
    EXPECT_FALSE(report.isRigid());
    EXPECT_DOUBLE_EQ(report.orthonormality_error, 0.0);
    EXPECT_DOUBLE_EQ(report.determinant_error, 2.0);
}

TEST_F(Se3Test, RejectsBottomRow) {
    Dmat4 m = rigid;
    m(3, 1) = 1e-3;
    const Se3Report report = checkSE3(m);
    EXPECT_FALSE(report.isRigid());
    EXPECT_DOUBLE_EQ(report.bottom_row_error, 1e-3);

    Se3Check::Config lenient;
    lenient.bottom_row_tolerance = 1e-2;
    EXPECT_TRUE(isSE3(m, lenient));
}

TEST_F(Se3Test, RejectsNaN) {
    Dmat4 m = rigid;
    m(1, 1) = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(isSE3(m));
}

TEST_F(Se3Test, CheckedInverseThrowsPrecondition) {
    const Dmat4 scaled = Dmat4::scale(Dvec4(3.0, 3.0, 3.0, 1.0));
    try {
        invertSE3Checked(scaled);
        FAIL() << "Expected KMError";
    } catch (const KMError& e) {
        EXPECT_EQ(e.getCategory(), KMError::Category::PRECONDITION);
        EXPECT_NE(e.getFormattedMessage().find("[PRECONDITION]"), std::string::npos);
        EXPECT_FALSE(e.getContext().empty());
    }
}

TEST_F(Se3Test, RejectionIsLogged) {
    EXPECT_THROW(invertSE3Checked(Dmat4::scale(Dvec4(2.0, 2.0, 2.0, 1.0))), KMError);
    EXPECT_EQ(countSe3Warnings(), 1u);
}

TEST_F(Se3Test, RejectionLoggingCanBeDisabled) {
    Se3Check::Config config;
    config.log_violations = false;
    const Se3Check checker(config);

    EXPECT_THROW(checker.invert(Dmat4::zero()), KMError);
    EXPECT_EQ(countSe3Warnings(), 0u);
    EXPECT_FALSE(checker.getConfig().log_violations);
}

TEST_F(Se3Test, FloatOverloads) {
    const Fmat4 m = Fmat4::translation(Fvec4::direction(1.0f, 2.0f, 3.0f)) * Fmat4::rotationY(0.4f);
    EXPECT_TRUE(isSE3(m));
    EXPECT_EQ(invertSE3Checked(m), m.invertSE3());

    const Fmat4 scaled = Fmat4::scale(Fvec4(1.0f, 1.5f, 1.0f, 1.0f));
    EXPECT_FALSE(isSE3(scaled));
    EXPECT_THROW(invertSE3Checked(scaled), KMError);
}

TEST_F(Se3Test, FloatToleranceIsLooser) {
    const Se3Check::Config d = Se3Check::Config::defaultConfig();
    const Se3Check::Config f = Se3Check::Config::floatConfig();
    EXPECT_GT(f.orthonormality_tolerance, d.orthonormality_tolerance);
    EXPECT_GT(f.determinant_tolerance, d.determinant_tolerance);

    const Fmat4 m = Fmat4::rotationZ(0.3f) * Fmat4::rotationX(1.1f) * Fmat4::rotationY(-2.2f);
    EXPECT_TRUE(isSE3(m, f));
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
