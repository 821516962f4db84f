#include <gtest/gtest.h>
#include "km_la.h"
#include <cmath>
#include <random>

using namespace kmath;

class Dmat4Test : public ::testing::Test {
protected:
    void SetUp() override {
        m1 = Dmat4::fromColumns(Dvec4(1.0, 2.0, 3.0, 4.0),
                                Dvec4(5.0, 6.0, 7.0, 8.0),
                                Dvec4(9.0, 10.0, 11.0, 12.0),
                                Dvec4(13.0, 14.0, 15.0, 16.0));
        m2 = Dmat4::fromColumns(Dvec4(17.0, 18.0, 19.0, 20.0),
                                Dvec4(21.0, 22.0, 23.0, 24.0),
                                Dvec4(25.0, 26.0, 27.0, 28.0),
                                Dvec4(29.0, 30.0, 31.0, 32.0));
        gen.seed(99);
    }

    Dmat4 randomMatrix() {
        std::uniform_real_distribution<double> dist(-10.0, 10.0);
        Dmat4 m;
        for (size_t c = 0; c < 4; ++c) {
            m[c] = Dvec4(dist(gen), dist(gen), dist(gen), dist(gen));
        }
        return m;
    }

    Dmat4 randomRigid() {
        std::uniform_real_distribution<double> angle(-PI, PI);
        std::uniform_real_distribution<double> offset(-50.0, 50.0);
        return Dmat4::translation(Dvec4::direction(offset(gen), offset(gen), offset(gen))) *
               Dmat4::rotationZ(angle(gen)) * Dmat4::rotationY(angle(gen)) * Dmat4::rotationX(angle(gen));
    }

    Dmat4 m1, m2;
    std::mt19937 gen;
};

TEST_F(Dmat4Test, DefaultIsIdentity) {
    const Dmat4 m;
    for (size_t r = 0; r < 4; ++r) {
        for (size_t c = 0; c < 4; ++c) {
            EXPECT_DOUBLE_EQ(m(r, c), r == c ? 1.0 : 0.0);
        }
    }
    EXPECT_EQ(m, Dmat4::identity());
    EXPECT_EQ(Dmat4::zero(), Dmat4::splat(0.0));
}

TEST_F(Dmat4Test, ColumnMajorAccess) {
    EXPECT_DOUBLE_EQ(m1(0, 1), 5.0);
    EXPECT_DOUBLE_EQ(m1(1, 0), 2.0);
    EXPECT_DOUBLE_EQ(m1(3, 3), 16.0);
    EXPECT_EQ(m1[2], Dvec4(9.0, 10.0, 11.0, 12.0));

    Dmat4 m = m1;
    m(2, 3) = -1.0;
    EXPECT_DOUBLE_EQ(m[3].z(), -1.0);
}

TEST_F(Dmat4Test, FromRows) {
    const Dmat4 m = Dmat4::fromRows({1.0, 5.0, 9.0, 13.0},
                                    {2.0, 6.0, 10.0, 14.0},
                                    {3.0, 7.0, 11.0, 15.0},
                                    {4.0, 8.0, 12.0, 16.0});
    EXPECT_EQ(m, m1);
}

TEST_F(Dmat4Test, LoadStore) {
    double raw[17];
    m1.store(raw + 1);
    for (int i = 0; i < 16; ++i) {
        EXPECT_DOUBLE_EQ(raw[i + 1], static_cast<double>(i + 1));
    }
    EXPECT_EQ(Dmat4::load(raw + 1), m1);
}

TEST_F(Dmat4Test, MatrixVectorProduct) {
    const Dvec4 v(17.0, 18.0, 19.0, 20.0);
    EXPECT_EQ(m1 * v, Dvec4(538.0, 612.0, 686.0, 760.0));
}

TEST_F(Dmat4Test, Addition) {
    EXPECT_EQ(m1 + m2, Dmat4::fromColumns(Dvec4(18.0, 20.0, 22.0, 24.0),
                                          Dvec4(26.0, 28.0, 30.0, 32.0),
                                          Dvec4(34.0, 36.0, 38.0, 40.0),
                                          Dvec4(42.0, 44.0, 46.0, 48.0)));
}

TEST_F(Dmat4Test, Subtraction) {
    EXPECT_EQ(m1 - m2, Dmat4::splat(-16.0));
    EXPECT_EQ(-m1 + m1, Dmat4::zero());

    Dmat4 m = m1;
    m += m2;
    m -= m2;
    EXPECT_EQ(m, m1);
}

TEST_F(Dmat4Test, MatrixProduct) {
    EXPECT_EQ(m1 * m2, Dmat4::fromColumns(Dvec4(538.0, 612.0, 686.0, 760.0),
                                          Dvec4(650.0, 740.0, 830.0, 920.0),
                                          Dvec4(762.0, 868.0, 974.0, 1080.0),
                                          Dvec4(874.0, 996.0, 1118.0, 1240.0)));

    Dmat4 m = m1;
    m *= m2;
    EXPECT_EQ(m, m1 * m2);
}

TEST_F(Dmat4Test, MatrixProductMatchesScalarLoop) {
    for (int i = 0; i < 100; ++i) {
        const Dmat4 a = randomMatrix();
        const Dmat4 b = randomMatrix();
        const Dmat4 p = a * b;
        for (size_t r = 0; r < 4; ++r) {
            for (size_t c = 0; c < 4; ++c) {
                double expected = 0.0;
                for (size_t k = 0; k < 4; ++k) {
                    expected += a(r, k) * b(k, c);
                }
                EXPECT_NEAR(p(r, c), expected, 1e-12);
            }
        }
    }
}

TEST_F(Dmat4Test, IdentityProduct) {
    for (int i = 0; i < 100; ++i) {
        const Dmat4 m = randomMatrix();
        EXPECT_EQ(Dmat4::identity() * m, m);
        EXPECT_EQ(m * Dmat4::identity(), m);
        EXPECT_EQ(Dmat4::identity() * m[0], m[0]);
    }
}

TEST_F(Dmat4Test, Transpose) {
    EXPECT_EQ(m1.transpose(), Dmat4::fromColumns(Dvec4(1.0, 5.0, 9.0, 13.0),
                                                 Dvec4(2.0, 6.0, 10.0, 14.0),
                                                 Dvec4(3.0, 7.0, 11.0, 15.0),
                                                 Dvec4(4.0, 8.0, 12.0, 16.0)));

    for (int i = 0; i < 100; ++i) {
        const Dmat4 m = randomMatrix();
        EXPECT_EQ(transpose(transpose(m)), m);
        EXPECT_DOUBLE_EQ(transpose(m)(1, 3), m(3, 1));
    }
}

TEST_F(Dmat4Test, InverseOfRotationIsTranspose) {
    const Dmat4 rotation = Dmat4::fromColumns(Dvec4(1.0, 0.0, 0.0, 0.0),
                                              Dvec4(0.0, std::cos(1.0), -std::sin(1.0), 0.0),
                                              Dvec4(0.0, std::sin(1.0), std::cos(1.0), 0.0),
                                              Dvec4(0.0, 0.0, 0.0, 1.0));
    EXPECT_EQ(rotation.invertSE3(), rotation.transpose());
    EXPECT_EQ(invertSE3(Dmat4::rotationY(0.3)), Dmat4::rotationY(0.3).transpose());
}

TEST_F(Dmat4Test, InverseOfRotationAndTranslation) {
    const double two_thirds = 0.6666666666666666;
    const double third = 0.3333333333333333;
    const Dmat4 m = Dmat4::fromColumns(Dvec4(two_thirds, two_thirds, -third, 0.0),
                                       Dvec4(-third, two_thirds, two_thirds, 0.0),
                                       Dvec4(two_thirds, -third, two_thirds, 0.0),
                                       Dvec4(-4.0, 5.0, 6.0, 1.0));
    const Dmat4 expected = Dmat4::fromColumns(Dvec4(two_thirds, -third, two_thirds, 0.0),
                                              Dvec4(two_thirds, two_thirds, -third, 0.0),
                                              Dvec4(-third, two_thirds, two_thirds, 0.0),
                                              Dvec4(1.3333333333333333, -8.666666666666666, 0.33333333333333326, 1.0));

    const Dmat4 inv = m.invertSE3();
    EXPECT_EQ(inv[0], expected[0]);
    EXPECT_EQ(inv[1], expected[1]);
    EXPECT_EQ(inv[2], expected[2]);
    EXPECT_TRUE(approxEqual(inv[3], expected[3], 1e-14));
}

TEST_F(Dmat4Test, InverseComposesToIdentity) {
    for (int i = 0; i < 200; ++i) {
        const Dmat4 m = randomRigid();
        const Dmat4 inv = m.invertSE3();
        EXPECT_TRUE(approxEqual(m * inv, Dmat4::identity(), 1e-12));
        EXPECT_TRUE(approxEqual(inv * m, Dmat4::identity(), 1e-12));
    }
}

TEST_F(Dmat4Test, InverseBottomRowIsExact) {
    // The bottom row of the input is not read
    Dmat4 m = randomRigid();
    m(3, 0) = 0.5;
    m(3, 1) = -2.0;
    m(3, 3) = 7.0;
    EXPECT_EQ(m.invertSE3().transpose()[3], Dvec4(0.0, 0.0, 0.0, 1.0));
}

TEST_F(Dmat4Test, ScaledInputIsNotInverted) {
    const Dmat4 s = Dmat4::scale(Dvec4(2.0, 2.0, 2.0, 1.0));
    EXPECT_FALSE(approxEqual(s * s.invertSE3(), Dmat4::identity(), 1e-6));
}

TEST_F(Dmat4Test, RigidRoundTrip) {
    const Dmat4 m = Dmat4::translation(Dvec4::direction(1.0, 2.0, 3.0)) * Dmat4::rotationZ(PI_2);
    const Dvec4 p = Dvec4::point(4.0, -5.0, 6.0);

    const Dvec4 q = m.transformPoint(p);
    EXPECT_TRUE(approxEqual(q, Dvec4::point(6.0, 6.0, 9.0), 1e-9));

    const Dvec4 back = m.invertSE3().transformPoint(q);
    EXPECT_TRUE(approxEqual(back, p, 1e-9));
}

TEST_F(Dmat4Test, TransformDirectionIgnoresTranslation) {
    const Dmat4 m = Dmat4::translation(Dvec4::direction(10.0, 20.0, 30.0));
    const Dvec4 d(1.0, 2.0, 3.0, 5.0);
    EXPECT_EQ(m.transformDirection(d), Dvec4::direction(1.0, 2.0, 3.0));
    EXPECT_EQ(m.transformPoint(d), Dvec4::point(11.0, 22.0, 33.0));
    EXPECT_EQ(m.getTranslation(), Dvec4::direction(10.0, 20.0, 30.0));
}

TEST_F(Dmat4Test, RotationConventions) {
    const Dvec4 x = Dvec4::direction(1.0, 0.0, 0.0);
    const Dvec4 y = Dvec4::direction(0.0, 1.0, 0.0);
    const Dvec4 z = Dvec4::direction(0.0, 0.0, 1.0);

    // Right-handed, counter-clockwise for positive angles
    EXPECT_TRUE(approxEqual(Dmat4::rotationZ(PI_2) * x, y, 1e-15));
    EXPECT_TRUE(approxEqual(Dmat4::rotationX(PI_2) * y, z, 1e-15));
    EXPECT_TRUE(approxEqual(Dmat4::rotationY(PI_2) * z, x, 1e-15));
}

TEST(Dmat4Layout, SizeAndAlignment) {
    EXPECT_EQ(sizeof(Dvec2), 16u);
    EXPECT_EQ(alignof(Dvec2), 16u);
    EXPECT_EQ(sizeof(Dvec4), 32u);
    EXPECT_EQ(alignof(Dvec4), 32u);
    EXPECT_EQ(sizeof(Dmat4), 128u);
    EXPECT_EQ(alignof(Dmat4), 32u);

    const Dmat4 m = Dmat4::identity();
    const double* raw = m[0].data();
    EXPECT_EQ(m[1].data(), raw + 4);
    EXPECT_EQ(m[3].data(), raw + 12);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
