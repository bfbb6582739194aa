#define BOOST_TEST_MODULE IntensityCalibrator_suite

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include <boost/test/included/unit_test.hpp>

#include "xrfcal/Errors.hpp"
#include "xrfcal/IntensityCalibrator.hpp"
#include "xrfcal/LineDatabase.hpp"
#include "xrfcal/LineIntensitySource.hpp"
#include "xrfcal/SyntheticSpectrum.hpp"

using namespace xrfcal;
namespace fs = std::filesystem;

namespace
{
  // hands back a fixed line list whatever the sample
  class FixedLineSource : public LineIntensitySource
  {
  public:
    explicit FixedLineSource( std::vector<ElementLine> lines ) : m_lines( std::move(lines) ) {}

    IntensitySourceKind kind() const override { return IntensitySourceKind::Measured; }

    std::vector<ElementLine> expected_lines( const StandardSample &, const DetectorParameters & ) const override
    {
      return m_lines;
    }

  private:
    std::vector<ElementLine> m_lines;
  };

  // records what it was asked and predicts one K alpha line per element
  class RecordingPredictor : public IntensityPredictor
  {
  public:
    mutable Composition last_composition;
    mutable double last_excitation = 0.0;

    PredictedIntensities predict_intensities( const Composition &composition, double excitation_kev,
                                              const Geometry & ) const override
    {
      last_composition = composition;
      last_excitation = excitation_kev;

      PredictedIntensities out;
      out["Fe"]["Ka1"] = { 6.404, 100.0 };
      out["Fe"]["Kb1"] = { 7.058, 0.0 };          // dropped, no rate
      out["Zr"]["Ka1"] = { 15.775, 40.0 };
      out["Ba"]["Ka1"] = { 32.194, 10.0 };        // above the excitation energy
      return out;
    }
  };

  std::vector<ElementLine> standard_lines()
  {
    return {
      { "Ti", "Ka1", 4.511, 500.0 },
      { "Fe", "Ka1", 6.404, 1000.0 },
      { "Fe", "Kb1", 7.058, 170.0 },
      { "Cu", "Ka1", 8.048, 800.0 },
      { "Zn", "Ka1", 8.639, 600.0 },
      { "Zr", "Ka1", 15.775, 400.0 }
    };
  }

  Vector energy_axis()
  {
    Vector e( 2048 );
    for( Index i = 0; i < e.size(); ++i )
      e[i] = (i + 0.5)*0.01;
    return e;
  }

  Spectrum noise_free_standard( const SynthesisParameters &truth, const ScatterOptions &scatter = {} )
  {
    Spectrum sp;
    sp.label  = "standard";
    sp.energy = energy_axis();
    sp.counts = synthesize( sp.energy, standard_lines(), truth, scatter );
    return sp;
  }

  SynthesisParameters truth_parameters()
  {
    SynthesisParameters t;
    t.resolution.fwhm_0  = 0.090;
    t.resolution.epsilon = 0.0005;
    t.intensity_scale    = 1.0;
    return t;
  }

  IntensityCalibratorConfig base_config()
  {
    IntensityCalibratorConfig cfg;
    cfg.background.method = BackgroundMethod::None;
    cfg.refine_efficiency = false;
    return cfg;
  }
}//namespace


BOOST_AUTO_TEST_CASE( ComptonAndEfficiency )
{
  const double e = 20.216;
  BOOST_CHECK_CLOSE( compton_energy( e, 90.0 ), e/(1.0 + e/511.0), 1.0e-9 );
  BOOST_CHECK_CLOSE( compton_energy( e, 180.0 ), e/(1.0 + 2.0*e/511.0), 1.0e-9 );
  BOOST_CHECK_CLOSE( compton_energy( e, 0.0 ), e, 1.0e-9 );

  EfficiencyCurve flat;
  BOOST_CHECK_EQUAL( flat( 10.0 ), 1.0 );

  EfficiencyCurve falling{ 1.0, -1.0, 0.0 };
  BOOST_CHECK_EQUAL( falling( 5.0 ), 0.1 );

  EfficiencyCurve rising{ 1.0, 1.0, 0.0 };
  BOOST_CHECK_EQUAL( rising( 5.0 ), 1.5 );
}


BOOST_AUTO_TEST_CASE( SynthesisPeakHeights )
{
  const Vector e = energy_axis();
  SynthesisParameters p = truth_parameters();
  p.intensity_scale = 2.0;

  const std::vector<ElementLine> one = { { "Fe", "Ka1", 6.405, 1000.0 } };
  const Vector y = synthesize( e, one, p );

  // 6.405 keV sits on a channel center
  BOOST_CHECK_CLOSE( y.maxCoeff(), 2000.0, 1.0e-6 );
  BOOST_CHECK_EQUAL( y[0], 0.0 );

  ScatterOptions scatter;
  scatter.tube_lines.push_back( { "Rh-Ka", 20.216, 1.0 } );
  p.scatter_scale = 0.0;
  BOOST_CHECK_EQUAL( synthesize( e, {}, p, scatter ).maxCoeff(), 0.0 );
  p.scatter_scale = 50.0;
  const Vector s = synthesize( e, {}, p, scatter );
  const Index compton = static_cast<Index>( compton_energy( 20.216, 90.0 )/0.01 );
  BOOST_CHECK( s[compton] > 25.0 );

  MockSpectrumOptions opt;
  opt.poisson_noise = false;
  const Spectrum mock = make_mock_spectrum( e, one, truth_parameters(), opt );
  BOOST_CHECK_CLOSE( mock.counts[0], 20.0 - 0.5*e[0], 1.0e-9 );
  BOOST_CHECK_EQUAL( mock.counts[e.size() - 1], std::max( 1.0, 20.0 - 0.5*e[e.size() - 1] ) );

  opt.poisson_noise = true;
  const Spectrum a = make_mock_spectrum( e, one, truth_parameters(), opt );
  const Spectrum b = make_mock_spectrum( e, one, truth_parameters(), opt );
  BOOST_CHECK( a.counts == b.counts );
  BOOST_CHECK( a.counts.minCoeff() >= 0.0 );
}


BOOST_AUTO_TEST_CASE( RecoverResolutionFromStandard )
{
  const SynthesisParameters truth = truth_parameters();
  StandardSample sample;
  sample.spectrum = noise_free_standard( truth );

  const auto source = std::make_shared<FixedLineSource>( standard_lines() );
  const IntensityCalibrator calib( base_config(), source );

  BOOST_CHECK_EQUAL( calib.starting_resolution().fwhm_0, DetectorParameters().fwhm_0 );

  const CalibrationResult res = calib.calibrate( sample );
  BOOST_REQUIRE_MESSAGE( res.success, res.message );
  BOOST_CHECK_CLOSE( res.fwhm_0, truth.resolution.fwhm_0, 5.0 );
  BOOST_CHECK_CLOSE( res.epsilon, truth.resolution.epsilon, 5.0 );
  BOOST_CHECK_CLOSE( res.intensity_scale, 1.0, 5.0 );
  BOOST_CHECK_EQUAL( res.scatter_scale, 0.0 );
  BOOST_CHECK_EQUAL( res.n_lines, 6 );
  BOOST_CHECK( res.r_squared > 0.99 );
  BOOST_CHECK( std::isfinite( res.chi_squared ) );
  BOOST_CHECK( res.iterations > 0 );
  BOOST_CHECK_EQUAL( res.fwhm_model_type, "detector" );
  BOOST_CHECK( !res.fwhm_calibration.has_value() );
}


BOOST_AUTO_TEST_CASE( StridedPowellWithResolutionModel )
{
  const SynthesisParameters truth = truth_parameters();
  const Spectrum sp = noise_free_standard( truth );

  ResolutionModel model = default_detector_model();
  model.params << 0.085, 0.00048;

  IntensityCalibratorConfig cfg = base_config();
  cfg.minimizer  = MinimizerKind::Powell;
  cfg.resolution = model;
  cfg.stride     = 3;

  const IntensityCalibrator calib( cfg, std::make_shared<FixedLineSource>( standard_lines() ) );
  BOOST_CHECK_EQUAL( calib.starting_resolution().fwhm_0, 0.085 );

  const CalibrationResult res = calib.calibrate_lines( sp, standard_lines() );
  BOOST_REQUIRE_MESSAGE( res.success, res.message );
  BOOST_CHECK_CLOSE( res.fwhm_0, truth.resolution.fwhm_0, 5.0 );
  BOOST_CHECK_CLOSE( res.epsilon, truth.resolution.epsilon, 5.0 );

  // held within the tolerance band of the model
  BOOST_CHECK( res.fwhm_0 <= 1.2*0.085 + 1.0e-12 );
  BOOST_CHECK( res.epsilon >= 0.8*0.00048 - 1.0e-12 );
  BOOST_REQUIRE( res.fwhm_calibration.has_value() );
  BOOST_CHECK_EQUAL( res.fwhm_calibration->params[0], 0.085 );
}


BOOST_AUTO_TEST_CASE( ScatterPeaksAreFitted )
{
  ScatterOptions scatter;
  scatter.tube_lines.push_back( { "Rh-Ka", 20.216, 1.0 } );

  SynthesisParameters truth = truth_parameters();
  truth.scatter_scale = 300.0;
  const Spectrum sp = noise_free_standard( truth, scatter );

  IntensityCalibratorConfig cfg = base_config();
  cfg.scatter = scatter;

  const IntensityCalibrator calib( cfg, std::make_shared<FixedLineSource>( standard_lines() ) );
  const CalibrationResult res = calib.calibrate_lines( sp, standard_lines() );

  BOOST_REQUIRE_MESSAGE( res.success, res.message );
  BOOST_CHECK_CLOSE( res.scatter_scale, 300.0, 10.0 );
  BOOST_CHECK_CLOSE( res.fwhm_0, truth.resolution.fwhm_0, 10.0 );
}


BOOST_AUTO_TEST_CASE( CallbackSeesPhysicalUnitsAndCancels )
{
  const Spectrum sp = noise_free_standard( truth_parameters() );
  const IntensityCalibrator calib( base_config(), std::make_shared<FixedLineSource>( standard_lines() ) );

  int calls = 0;
  Vector seen;
  const IterationCallback cancel = [&]( int, const Vector &x, double ){
    ++calls;
    seen = x;
    return false;
  };

  const CalibrationResult res = calib.calibrate_lines( sp, standard_lines(), cancel );
  BOOST_CHECK( !res.success );
  BOOST_CHECK_EQUAL( res.message, "cancelled by callback" );
  BOOST_CHECK_EQUAL( calls, 1 );

  // fwhm_0, epsilon and the intensity scale are free here
  BOOST_REQUIRE_EQUAL( seen.size(), 3 );
  BOOST_CHECK( seen[0] >= 0.02 && seen[0] <= 0.2 );
  BOOST_CHECK( seen[1] >= 0.00005 && seen[1] <= 0.01 );
  BOOST_CHECK( seen[2] > 0.0 );
}


BOOST_AUTO_TEST_CASE( DegenerateInputs )
{
  const auto source = std::make_shared<FixedLineSource>( standard_lines() );

  BOOST_CHECK_THROW( (IntensityCalibrator{ base_config(), nullptr }), ConfigurationError );

  IntensityCalibratorConfig bad_stride = base_config();
  bad_stride.stride = 0;
  BOOST_CHECK_THROW( (IntensityCalibrator{ bad_stride, source }), ConfigurationError );

  IntensityCalibratorConfig bad_tol = base_config();
  bad_tol.resolution_tolerance = 1.5;
  BOOST_CHECK_THROW( (IntensityCalibrator{ bad_tol, source }), ConfigurationError );

  const IntensityCalibrator calib( base_config(), source );
  const CalibrationResult none = calib.calibrate_lines( noise_free_standard( truth_parameters() ), {} );
  BOOST_CHECK( !none.success );
  BOOST_CHECK_EQUAL( none.message, "no expected lines to calibrate against" );
  BOOST_CHECK_EQUAL( none.n_lines, 0 );
}


BOOST_AUTO_TEST_CASE( NonFiniteModelIsPenalised )
{
  // one expected line with an undefined intensity poisons the model around 5.5 keV
  std::vector<ElementLine> lines = standard_lines();
  lines.push_back( { "Xx", "Ka1", 5.5, std::numeric_limits<double>::quiet_NaN() } );
  const Spectrum sp = noise_free_standard( truth_parameters() );

  for( const auto kind : { MinimizerKind::Powell, MinimizerKind::QuasiNewton } )
  {
    IntensityCalibratorConfig cfg = base_config();
    cfg.minimizer = kind;
    cfg.penalty   = 12345.0;

    std::vector<double> values;
    const IterationCallback record = [&values]( int, const Vector &, double f ){
      values.push_back( f );
      return true;
    };

    const IntensityCalibrator calib( cfg, std::make_shared<FixedLineSource>( lines ) );
    const CalibrationResult res = calib.calibrate_lines( sp, lines, record );

    for( const double f : values )
      BOOST_CHECK_EQUAL( f, 12345.0 );
    if( kind == MinimizerKind::Powell )
      BOOST_CHECK( !values.empty() );

    BOOST_CHECK( !res.success );
    BOOST_CHECK_EQUAL( res.message, "model spectrum is not finite" );
    BOOST_CHECK( std::isinf( res.chi_squared ) );
    BOOST_CHECK_EQUAL( res.r_squared, 0.0 );
    BOOST_CHECK( std::isfinite( res.fwhm_0 ) );
    BOOST_CHECK( std::isfinite( res.epsilon ) );
    BOOST_CHECK( std::isfinite( res.intensity_scale ) );

    const nlohmann::json j = res;
    BOOST_CHECK( j["chi_squared"].is_null() );
  }
}


BOOST_AUTO_TEST_CASE( ShapeRefinedCalibration )
{
  SynthesisParameters truth = truth_parameters();
  truth.resolution.epsilon = 0.0006;
  truth.tail.amplitude = 0.1;
  truth.tail.slope = 3.0;
  truth.element_scales["Cu"] = 0.8;
  truth.element_scales["Zn"] = 1.3;

  StandardSample sample;
  sample.spectrum = noise_free_standard( truth );

  IntensityCalibratorConfig cfg = base_config();
  cfg.refine_shape = true;
  const IntensityCalibrator calib( cfg, std::make_shared<FixedLineSource>( standard_lines() ) );

  const CalibrationResult res = calib.calibrate( sample );
  BOOST_REQUIRE_MESSAGE( res.success, res.message );
  BOOST_CHECK_CLOSE( res.fwhm_0, 0.090, 2.0 );
  BOOST_CHECK_CLOSE( res.epsilon, 0.0006, 3.0 );
  BOOST_REQUIRE( res.tail.has_value() );
  BOOST_CHECK_CLOSE( res.tail->amplitude, 0.1, 5.0 );
  BOOST_CHECK_CLOSE( res.tail->slope, 3.0, 5.0 );
  BOOST_CHECK_CLOSE( res.intensity_scale, 1.0, 2.0 );
  BOOST_CHECK( res.r_squared > 0.999 );

  // Fe carries the most expected intensity and anchors the element scales
  BOOST_REQUIRE_EQUAL( res.element_scales.size(), 5u );
  BOOST_CHECK_EQUAL( res.element_scales.at( "Fe" ), 1.0 );
  BOOST_CHECK_CLOSE( res.element_scales.at( "Cu" ), 0.8, 2.0 );
  BOOST_CHECK_CLOSE( res.element_scales.at( "Zn" ), 1.3, 2.0 );
  BOOST_CHECK_CLOSE( res.element_scales.at( "Ti" ), 1.0, 2.0 );

  const CalibrationResult back = nlohmann::json( res ).get<CalibrationResult>();
  BOOST_REQUIRE( back.tail.has_value() );
  BOOST_CHECK_EQUAL( back.tail->slope, res.tail->slope );
  BOOST_CHECK_EQUAL( back.element_scales.at( "Zn" ), res.element_scales.at( "Zn" ) );

  // the plain calibration leaves the shape fields empty
  const CalibrationResult plain = IntensityCalibrator( base_config(), std::make_shared<FixedLineSource>( standard_lines() ) )
                                    .calibrate_lines( noise_free_standard( truth_parameters() ), standard_lines() );
  BOOST_CHECK( !plain.tail.has_value() );
  BOOST_CHECK( plain.element_scales.empty() );
  BOOST_CHECK( !nlohmann::json( plain ).contains( "tail_amplitude" ) );

  const CalibrationResult none = calib.calibrate_with_shape_refinement( sample.spectrum, {} );
  BOOST_CHECK( !none.success );
  BOOST_CHECK_EQUAL( none.message, "no expected lines to calibrate against" );
}


BOOST_AUTO_TEST_CASE( CalibrationDocuments )
{
  CalibrationResult r;
  r.fwhm_0 = 0.0912;
  r.epsilon = 0.00047;
  r.intensity_scale = 1.7;
  r.efficiency = EfficiencyCurve{ 1.0, -0.02, 0.001 };
  r.success = false;
  r.message = "diverged";
  r.fwhm_calibration = default_detector_model();
  r.n_lines = 9;

  const nlohmann::json j = r;
  BOOST_CHECK( j["chi_squared"].is_null() );
  BOOST_CHECK_EQUAL( j["efficiency_params"]["b"].get<double>(), -0.02 );

  const CalibrationResult back = j.get<CalibrationResult>();
  BOOST_CHECK( std::isinf( back.chi_squared ) );
  BOOST_CHECK_EQUAL( back.fwhm_0, 0.0912 );
  BOOST_CHECK_EQUAL( back.efficiency.c, 0.001 );
  BOOST_CHECK_EQUAL( back.n_lines, 9 );
  BOOST_REQUIRE( back.fwhm_calibration.has_value() );
  BOOST_CHECK_EQUAL( back.fwhm_calibration->params[1], 0.0004 );

  const std::string path = (fs::temp_directory_path() / "xrfcal_test_calibration.json").string();
  r.chi_squared = 3.25;
  save_calibration( r, path );
  BOOST_CHECK_EQUAL( load_calibration( path ).chi_squared, 3.25 );

  std::ofstream( path ) << "{ \"epsilon\": 0.0004 }";
  BOOST_CHECK_THROW( load_calibration( path ), ConfigurationError );
  fs::remove( path );
}


BOOST_AUTO_TEST_CASE( MeasuredLineSource )
{
  const nlohmann::json doc = {
    {"Fe", {{"K", { {{"name", "Ka1"}, {"energy", 6.404}},
                    {{"name", "Kb1"}, {"energy_keV", 7.058}},
                    {{"name", "Kb3"}, {"energy", 7.1}} }}}},
    {"Cu", {{"K", nlohmann::json::array( { {{"name", "Ka1"}, {"energy", 8.048}} } )}}}
  };
  const auto db = std::make_shared<JsonLineDatabase>( doc );
  BOOST_CHECK_EQUAL( db->get_lines( "Fe" ).at( "K" ).size(), 3u );
  BOOST_CHECK( db->get_lines( "Og" ).empty() );

  BOOST_CHECK( is_major_line( "Kα1" ) );
  BOOST_CHECK( !is_major_line( "Kb3" ) );

  MockSpectrumOptions opt;
  opt.poisson_noise = false;
  const std::vector<ElementLine> lines = { { "Fe", "Ka1", 6.404, 2000.0 }, { "Fe", "Kb1", 7.058, 340.0 },
                                           { "Cu", "Ka1", 8.048, 900.0 } };

  StandardSample sample;
  sample.spectrum = make_mock_spectrum( energy_axis(), lines, truth_parameters(), opt );
  sample.concentrations_ppm = { {"Fe", 50000.0}, {"Cu", 50.0} };   // Cu below the threshold

  const auto source = make_line_source( IntensitySourceKind::Measured, db, nullptr );
  BOOST_CHECK( source->kind() == IntensitySourceKind::Measured );

  const std::vector<ElementLine> found = source->expected_lines( sample, DetectorParameters() );
  BOOST_REQUIRE_EQUAL( found.size(), 2u );
  BOOST_CHECK_EQUAL( found[0].line, "Ka1" );
  BOOST_CHECK_CLOSE( found[0].intensity, 2000.0, 3.0 );
  BOOST_CHECK_EQUAL( found[1].line, "Kb1" );

  // Fe K lines are not excited below 7.1 keV
  sample.excitation_energy = 7.0;
  BOOST_CHECK_EQUAL( source->expected_lines( sample, DetectorParameters() ).size(), 1u );

  BOOST_CHECK_THROW( make_line_source( IntensitySourceKind::Measured, nullptr, nullptr ), ConfigurationError );
}


BOOST_AUTO_TEST_CASE( PredictedLineSource )
{
  BOOST_CHECK( parse_intensity_source_kind( "fp" ) == IntensitySourceKind::Predicted );
  BOOST_CHECK( parse_intensity_source_kind( "Measured" ) == IntensitySourceKind::Measured );
  BOOST_CHECK_THROW( parse_intensity_source_kind( "guess" ), ConfigurationError );

  BOOST_CHECK_THROW( PredictedLineIntensities{ nullptr }, ConfigurationError );
  BOOST_CHECK_THROW( make_line_source( IntensitySourceKind::Predicted, nullptr, nullptr ), ConfigurationError );

  const auto predictor = std::make_shared<RecordingPredictor>();
  const auto source = make_line_source( IntensitySourceKind::Predicted, nullptr, predictor );

  StandardSample sample;
  sample.concentrations_ppm = { {"Fe", 30000.0}, {"Zr", 10000.0}, {"Ba", 0.0} };
  sample.excitation_energy = 30.0;

  const std::vector<ElementLine> lines = source->expected_lines( sample, DetectorParameters() );
  BOOST_REQUIRE_EQUAL( lines.size(), 2u );
  BOOST_CHECK_EQUAL( lines[0].element, "Fe" );
  BOOST_CHECK_EQUAL( lines[1].element, "Zr" );
  BOOST_CHECK_EQUAL( lines[1].intensity, 40.0 );

  // mass fractions normalised to one, zero entries dropped
  BOOST_CHECK_EQUAL( predictor->last_composition.size(), 2u );
  BOOST_CHECK_CLOSE( predictor->last_composition.at( "Fe" ), 0.75, 1.0e-9 );
  BOOST_CHECK_EQUAL( predictor->last_excitation, 30.0 );
}


BOOST_AUTO_TEST_CASE( ConcentrationTable )
{
  const std::string path = (fs::temp_directory_path() / "xrfcal_test_standard.csv").string();
  {
    std::ofstream f( path );
    f << "Name,Symbol,Concentration_mg_kg,Uncertainty\n"
      << "Iron,Fe,52000,300\n"
      << "Copper,\"Cu\",n/a,\n"
      << "Zinc,Zn,,\n"
      << "Titanium,Ti,-5,\n"
      << "Zirconium,Zr,1200.5,10\n";
  }

  const auto conc = load_reference_concentrations( path );
  BOOST_CHECK_EQUAL( conc.size(), 2u );
  BOOST_CHECK_EQUAL( conc.at( "Fe" ), 52000.0 );
  BOOST_CHECK_EQUAL( conc.at( "Zr" ), 1200.5 );

  {
    std::ofstream f( path );
    f << "Element,Value\nFe,1\n";
  }
  BOOST_CHECK_THROW( load_reference_concentrations( path ), ConfigurationError );
  fs::remove( path );
}
