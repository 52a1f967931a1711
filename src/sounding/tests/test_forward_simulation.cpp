/**
 * @file test_forward_simulation.cpp
 * @brief Unit tests for the DC resistivity forward simulation
 */

#include <gtest/gtest.h>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <vector>

#include "errors.hpp"
#include "forward_simulation.hpp"

using namespace vesmod;

namespace {

constexpr double PI = 3.14159265358979323846;

// Surface potential of a unit source over two layers, method of images
double two_layer_potential(double r, double rho1, double rho2, double h) {
    const double k = (rho2 - rho1) / (rho2 + rho1);
    double sum = 1.0 / r;
    double kn = k;
    for (int n = 1; n < 5000 && std::abs(kn) > 1e-17; ++n) {
        sum += 2.0 * kn / std::sqrt(r * r + 4.0 * n * n * h * h);
        kn *= k;
    }
    return rho1 * sum / (2.0 * PI);
}

std::vector<double> log_spaced(double first, double last, int n) {
    std::vector<double> v(n);
    for (int i = 0; i < n; ++i) {
        v[i] = first * std::pow(last / first, static_cast<double>(i) / (n - 1));
    }
    return v;
}

Survey schlumberger_sounding(int n) {
    std::vector<double> ab2 = log_spaced(2.0, 500.0, n);
    std::vector<double> mn2(ab2.size());
    for (size_t i = 0; i < ab2.size(); ++i) {
        mn2[i] = ab2[i] / 10.0;
    }
    return Survey::schlumberger(ab2, mn2);
}

} // namespace

// ============================================================================
// Homogeneous half-space: every array recovers the true resistivity
// ============================================================================

class HomogeneousTest : public ::testing::Test {
protected:
    void expect_recovers(const Survey& survey) {
        ForwardSimulation sim(survey);
        DataSet data = sim.simulate(LayerStack::half_space(rho_));

        ASSERT_EQ(data.size(), survey.n_data());
        for (const auto& rec : data) {
            EXPECT_NEAR(rec.value, rho_, 1e-9 * rho_) << "datum " << rec.index;
        }
    }

    const double rho_ = 100.0;
};

TEST_F(HomogeneousTest, Schlumberger) {
    expect_recovers(schlumberger_sounding(15));
}

TEST_F(HomogeneousTest, Wenner) {
    expect_recovers(Survey::wenner({1.0, 5.0, 25.0, 125.0}));
}

TEST_F(HomogeneousTest, DipoleDipole) {
    expect_recovers(Survey::dipole_dipole(10.0, {1, 2, 3, 4, 5, 6}));
}

TEST_F(HomogeneousTest, PoleDipole) {
    expect_recovers(Survey::pole_dipole(10.0, {1, 2, 4, 8}));
}

TEST_F(HomogeneousTest, PolePole) {
    expect_recovers(Survey::pole_pole({3.0, 30.0, 300.0}));
}

TEST_F(HomogeneousTest, OffAxisLayout) {
    SourceDipole src(Electrode(0.0, 0.0), Electrode(40.0, 30.0), 2.5);
    std::vector<ReceiverDipole> rx = {
        ReceiverDipole(Electrode(10.0, -12.0), Electrode(18.0, -5.0)),
        ReceiverDipole(Electrode(-7.0, 22.0), Electrode::infinity())
    };
    expect_recovers(Survey({SurveyConfiguration(src, rx)}));
}

// ============================================================================
// Geometric factors and observables
// ============================================================================

TEST(GeometricFactorTest, Wenner) {
    ForwardSimulation sim(Survey::wenner({2.0, 7.0}));
    Eigen::VectorXd g = sim.geometric_factors();

    EXPECT_NEAR(g(0), 2.0 * PI * 2.0, 1e-12);
    EXPECT_NEAR(g(1), 2.0 * PI * 7.0, 1e-12);
}

TEST(GeometricFactorTest, PolePole) {
    ForwardSimulation sim(Survey::pole_pole({12.0}));
    EXPECT_NEAR(sim.geometric_factors()(0), 2.0 * PI * 12.0, 1e-10);
}

TEST(GeometricFactorTest, VoltageMatchesApparentResistivity) {
    Survey survey = Survey::dipole_dipole(5.0, {1, 2, 3});
    LayerStack model({30.0, 300.0}, {6.0});

    SimulationConfig voltage_config;
    voltage_config.data_type = DataType::Voltage;

    ForwardSimulation rho_sim(survey);
    ForwardSimulation v_sim(survey, voltage_config);

    DataSet rho_a = rho_sim.simulate(model);
    DataSet volts = v_sim.simulate(model);
    Eigen::VectorXd g = rho_sim.geometric_factors();

    EXPECT_EQ(volts.data_type(), DataType::Voltage);
    EXPECT_EQ(volts.column_names()[2], "voltage");
    for (size_t i = 0; i < rho_a.size(); ++i) {
        EXPECT_NEAR(volts.record(i).value * g(i), rho_a.record(i).value, 1e-9 * rho_a.record(i).value);
    }
}

TEST(GeometricFactorTest, VoltageScalesWithCurrent) {
    SourceDipole weak(Electrode(-50.0), Electrode(50.0), 1.0);
    SourceDipole strong(Electrode(-50.0), Electrode(50.0), 4.0);
    ReceiverDipole rx(Electrode(-5.0), Electrode(5.0));

    SimulationConfig config;
    config.data_type = DataType::Voltage;
    LayerStack model({100.0, 10.0}, {20.0});

    const double v1 = ForwardSimulation(Survey({SurveyConfiguration(weak, {rx})}), config)
                          .simulate(model).record(0).value;
    const double v4 = ForwardSimulation(Survey({SurveyConfiguration(strong, {rx})}), config)
                          .simulate(model).record(0).value;
    EXPECT_NEAR(v4, 4.0 * v1, 1e-12 * std::abs(v4));

    // Apparent resistivity does not depend on the current
    const double r1 = ForwardSimulation(Survey({SurveyConfiguration(weak, {rx})}))
                          .simulate(model).record(0).value;
    const double r4 = ForwardSimulation(Survey({SurveyConfiguration(strong, {rx})}))
                          .simulate(model).record(0).value;
    EXPECT_NEAR(r1, r4, 1e-12 * r1);
}

// ============================================================================
// Layered models
// ============================================================================

TEST(PointSourceTest, TwoLayerImageSeries) {
    const auto filter = hankel::default_filter();

    struct Case { double rho1, rho2, h; };
    for (const Case& c : {Case{100.0, 10.0, 5.0}, Case{10.0, 100.0, 5.0}, Case{50.0, 400.0, 7.5}}) {
        ResistivityKernel kernel(LayerStack({c.rho1, c.rho2}, {c.h}));
        for (double r : {0.5, 2.0, 10.0, 50.0, 300.0}) {
            const double expected = two_layer_potential(r, c.rho1, c.rho2, c.h);
            EXPECT_NEAR(point_source_potential(kernel, *filter, r), expected, 1e-7 * expected)
                << "rho1 = " << c.rho1 << ", rho2 = " << c.rho2 << ", r = " << r;
        }
    }
}

TEST(PointSourceTest, HalfSpaceIsExact) {
    ResistivityKernel kernel(LayerStack::half_space(250.0));
    EXPECT_DOUBLE_EQ(point_source_potential(kernel, *hankel::default_filter(), 5.0, 2.0),
                     2.0 * 250.0 / (2.0 * PI * 5.0));
}

TEST(ForwardSimulationTest, SchlumbergerTwoLayer) {
    const double rho1 = 100.0, rho2 = 10.0, h = 5.0;
    const std::vector<double> ab2 = {3.0, 10.0, 40.0, 150.0};
    const std::vector<double> mn2 = {0.5, 1.0, 4.0, 15.0};

    ForwardSimulation sim(Survey::schlumberger(ab2, mn2));
    DataSet data = sim.simulate(LayerStack({rho1, rho2}, {h}));

    for (size_t i = 0; i < ab2.size(); ++i) {
        const double am = ab2[i] - mn2[i];
        const double an = ab2[i] + mn2[i];
        const double v = 2.0 * (two_layer_potential(am, rho1, rho2, h) -
                                two_layer_potential(an, rho1, rho2, h));
        const double g = 2.0 * PI / (2.0 / am - 2.0 / an);
        EXPECT_NEAR(data.record(i).value, g * v, 1e-6 * g * v);
        EXPECT_DOUBLE_EQ(data.record(i).ab2, ab2[i]);
        EXPECT_DOUBLE_EQ(data.record(i).mn2, mn2[i]);
    }

    // Conductive basement pulls the curve down
    EXPECT_GT(data.record(0).value, data.record(3).value);
    EXPECT_NEAR(data.record(3).value, rho2, 0.2 * rho2);
}

TEST(ForwardSimulationTest, MappedModelMatchesStack) {
    Survey survey = schlumberger_sounding(8);
    ForwardSimulation sim(survey);

    Eigen::VectorXd m(3);
    m << std::log(200.0), std::log(20.0), std::log(2000.0);
    const std::vector<double> thicknesses = {4.0, 12.0};

    DataSet mapped = sim.simulate(m, PropertyMapping::log_resistivity(), thicknesses);
    DataSet direct = sim.simulate(LayerStack({200.0, 20.0, 2000.0}, thicknesses));

    for (size_t i = 0; i < direct.size(); ++i) {
        EXPECT_NEAR(mapped.record(i).value, direct.record(i).value, 1e-9 * direct.record(i).value);
    }

    EXPECT_THROW(sim.simulate(m, PropertyMapping::log_resistivity(), {4.0}), InvalidModelError);
}

TEST(ForwardSimulationTest, ThreadCountDoesNotChangeResults) {
    Survey survey = schlumberger_sounding(29);
    LayerStack model({400.0, 50.0, 400.0, 200.0, 2000.0, 20.0, 2000.0},
                     {8.0, 8.0, 4.0, 10.0, 10.0, 10.0});

    DataSet serial = ForwardSimulation(survey).simulate(model);

    for (size_t threads : {2u, 4u, 64u}) {
        SimulationConfig config;
        config.num_threads = threads;
        DataSet parallel = ForwardSimulation(survey, config).simulate(model);

        ASSERT_EQ(parallel.size(), serial.size());
        for (size_t i = 0; i < serial.size(); ++i) {
            EXPECT_EQ(parallel.record(i).value, serial.record(i).value);
            EXPECT_EQ(parallel.record(i).index, i);
        }
    }
}

TEST(ForwardSimulationTest, OversubscribedThreadsMatchSerial) {
    std::vector<double> ab2, mn2;
    for (int i = 0; i < 3000; ++i) {
        const double a = 2.0 * std::pow(500.0, i / 2999.0);
        ab2.push_back(a);
        mn2.push_back(a / 5.0);
    }
    Survey survey = Survey::schlumberger(ab2, mn2);
    LayerStack model({120.0, 15.0, 600.0}, {6.0, 20.0});

    SimulationConfig config;
    config.num_threads = 3000;

    DataSet serial = ForwardSimulation(survey).simulate(model);
    DataSet parallel;
    ASSERT_NO_THROW(parallel = ForwardSimulation(survey, config).simulate(model));

    ASSERT_EQ(parallel.size(), serial.size());
    for (size_t i = 0; i < serial.size(); ++i) {
        EXPECT_EQ(parallel.record(i).value, serial.record(i).value);
    }
}

TEST(ForwardSimulationTest, RecordsFollowSurveyDatumOrder) {
    SourceDipole src(Electrode(-50.0), Electrode(50.0));
    std::vector<ReceiverDipole> first = {ReceiverDipole(Electrode(-5.0), Electrode(5.0)),
                                         ReceiverDipole(Electrode(-10.0), Electrode(10.0)),
                                         ReceiverDipole(Electrode(-20.0), Electrode(20.0))};
    std::vector<ReceiverDipole> second = {ReceiverDipole(Electrode(-2.0), Electrode(2.0))};
    Survey survey({SurveyConfiguration(src, first),
                   SurveyConfiguration(SourceDipole(Electrode(-30.0), Electrode(30.0)), second)});

    SimulationConfig config;
    config.num_threads = 2;
    DataSet data = ForwardSimulation(survey, config).simulate(LayerStack({40.0, 400.0}, {10.0}));

    const std::vector<DatumIndex> layout = survey.datum_indices();
    ASSERT_EQ(data.size(), layout.size());
    for (size_t i = 0; i < layout.size(); ++i) {
        EXPECT_EQ(data.record(i).index, layout[i].index);
        EXPECT_EQ(data.record(i).source_index, layout[i].source_index);
        EXPECT_EQ(data.record(i).receiver_index, layout[i].receiver_index);
    }
    EXPECT_EQ(data.record(2).receiver_index, 2u);
    EXPECT_EQ(data.record(3).source_index, 1u);
    EXPECT_NEAR(data.record(3).mn2, 2.0, 1e-12);
}

TEST(ForwardSimulationTest, CustomFilter) {
    hankel::FilterDesign params;
    params.points_per_decade = 10.0;
    params.quadrature_intervals = 4000;
    auto filter = std::make_shared<const hankel::DigitalFilter>(hankel::DigitalFilter::design(params));

    ForwardSimulation sim(Survey::wenner({10.0}), SimulationConfig(), filter);
    EXPECT_EQ(&sim.filter(), filter.get());
    EXPECT_NEAR(sim.simulate(LayerStack::half_space(42.0)).record(0).value, 42.0, 1e-9);
}

// ============================================================================
// Error handling
// ============================================================================

TEST(ForwardSimulationErrorTest, InvalidConfig) {
    SimulationConfig config;
    config.num_threads = 0;
    EXPECT_THROW(ForwardSimulation(Survey::wenner({1.0}), config), std::invalid_argument);

    config = SimulationConfig();
    config.min_offset = 0.0;
    EXPECT_THROW(ForwardSimulation(Survey::wenner({1.0}), config), std::invalid_argument);
}

TEST(ForwardSimulationErrorTest, SourceOnReceiverElectrode) {
    SourceDipole good_src(Electrode(-20.0), Electrode(20.0));
    ReceiverDipole good_rx(Electrode(-2.0), Electrode(2.0));

    SourceDipole src(Electrode(0.0), Electrode(10.0));
    ReceiverDipole rx(Electrode(0.0), Electrode(5.0));  // M on A

    Survey survey({SurveyConfiguration(good_src, {good_rx}), SurveyConfiguration(src, {rx})});

    for (size_t threads : {1u, 2u}) {
        SimulationConfig config;
        config.num_threads = threads;
        ForwardSimulation sim(survey, config);
        try {
            sim.simulate(LayerStack({100.0, 10.0}, {5.0}));
            FAIL() << "Expected DegenerateGeometryError";
        } catch (const DegenerateGeometryError& e) {
            EXPECT_EQ(e.config_index(), 1u);
        }
    }
}

TEST(ForwardSimulationErrorTest, ReceiverOnEquipotential) {
    // M and N on the perpendicular bisector of AB
    SourceDipole src(Electrode(-10.0), Electrode(10.0));
    ReceiverDipole rx(Electrode(0.0, -5.0), Electrode(0.0, 5.0));

    ForwardSimulation sim(Survey({SurveyConfiguration(src, {rx})}));
    EXPECT_THROW(sim.simulate(LayerStack::half_space(100.0)), DegenerateGeometryError);
    EXPECT_THROW(sim.geometric_factors(), DegenerateGeometryError);

    // Voltage data need no geometric factor
    SimulationConfig config;
    config.data_type = DataType::Voltage;
    ForwardSimulation v_sim(Survey({SurveyConfiguration(src, {rx})}), config);
    EXPECT_NEAR(v_sim.simulate(LayerStack::half_space(100.0)).record(0).value, 0.0, 1e-12);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
