#define BOOST_TEST_MODULE ResolutionModel_suite

#include <cmath>
#include <filesystem>
#include <string>
#include <vector>

#include <boost/test/included/unit_test.hpp>

#include "xrfcal/Errors.hpp"
#include "xrfcal/JsonUtils.hpp"
#include "xrfcal/ResolutionCalibrator.hpp"
#include "xrfcal/ResolutionModel.hpp"

using namespace xrfcal;

namespace
{
  ResolutionModel make_model( const ResolutionModelKind kind, std::initializer_list<double> p,
                              const double aic_value = 0.0, const double bic_value = 0.0 )
  {
    ResolutionModel m;
    m.kind = kind;
    m.params.resize( static_cast<Index>(p.size()) );
    Index i = 0;
    for( const double v : p )
      m.params[i++] = v;
    m.param_errors = Vector::Zero( m.params.size() );
    m.aic = aic_value;
    m.bic = bic_value;
    return m;
  }
}//namespace


BOOST_AUTO_TEST_CASE( FamilyNamesAndLayouts )
{
  BOOST_CHECK_EQUAL( all_resolution_model_kinds().size(), 5u );
  for( const auto k : all_resolution_model_kinds() )
  {
    BOOST_CHECK( parse_resolution_model_kind( to_string(k) ) == k );
    const ResolutionModelSpec &spec = resolution_model_spec( k );
    BOOST_CHECK_EQUAL( spec.names.size(), spec.lower.size() );
    BOOST_CHECK_EQUAL( spec.names.size(), spec.upper.size() );
    BOOST_CHECK_EQUAL( spec.names.size(), spec.initial.size() );
    for( size_t i = 0; i < spec.names.size(); ++i )
      BOOST_CHECK( spec.lower[i] <= spec.initial[i] && spec.initial[i] <= spec.upper[i] );
  }

  BOOST_CHECK( parse_resolution_model_kind("Detector") == ResolutionModelKind::Detector );
  BOOST_CHECK_THROW( parse_resolution_model_kind("cubic"), ConfigurationError );
}


BOOST_AUTO_TEST_CASE( DetectorFormula )
{
  const ResolutionModel m = default_detector_model();
  BOOST_CHECK_EQUAL( m.params[0], 0.080 );
  BOOST_CHECK_EQUAL( m.params[1], 0.0004 );

  // FWHM(E) = sqrt(fwhm_0² + 2.355²·ε·E)
  const double e = 6.4;
  BOOST_CHECK_CLOSE( m.predict( e ), std::sqrt( 0.08*0.08 + 2.355*2.355*0.0004*e ), 1.0e-9 );
  BOOST_CHECK_CLOSE( m.predict( 0.0 ), 0.080, 1.0e-9 );

  // monotonic in energy
  double last = 0.0;
  for( double en = 0.5; en < 25.0; en += 0.5 )
  {
    BOOST_CHECK( m.predict( en ) > last );
    last = m.predict( en );
  }

  Vector es( 3 );
  es << 1.0, 5.0, 10.0;
  const Vector f = m.predict( es );
  BOOST_CHECK_CLOSE( f[2], m.predict( 10.0 ), 1.0e-12 );

  BOOST_CHECK_EQUAL( m.parameter( "epsilon" ), 0.0004 );
  BOOST_CHECK_THROW( m.parameter( "slope" ), ConfigurationError );

  const DetectorParameters d = m.detector_equivalent();
  BOOST_CHECK_EQUAL( d.fwhm_0, 0.080 );
  BOOST_CHECK_EQUAL( d.epsilon, 0.0004 );

  BOOST_CHECK( m.describe().find( "FWHM0=80.0 eV" ) != std::string::npos );
}


BOOST_AUTO_TEST_CASE( OtherFamilies )
{
  const ResolutionModel lin = make_model( ResolutionModelKind::Linear, { 0.09, 0.005 } );
  BOOST_CHECK_CLOSE( lin.predict( 6.0 ), 0.12, 1.0e-9 );

  const ResolutionModel quad = make_model( ResolutionModelKind::Quadratic, { 0.09, 0.004, 0.0001 } );
  BOOST_CHECK_CLOSE( quad.predict( 10.0 ), 0.09 + 0.04 + 0.01, 1.0e-9 );

  const ResolutionModel ex = make_model( ResolutionModelKind::Exponential, { 0.1, 0.02 } );
  BOOST_CHECK_CLOSE( ex.predict( 5.0 ), 0.1*std::exp( 0.1 ), 1.0e-9 );

  const ResolutionModel pw = make_model( ResolutionModelKind::Power, { 0.06, 0.3 } );
  BOOST_CHECK_CLOSE( pw.predict( 8.0 ), 0.06*std::pow( 8.0, 0.3 ), 1.0e-9 );
  BOOST_CHECK_EQUAL( pw.predict( 0.0 ), 0.0 );

  // negative values are never reported
  const ResolutionModel neg = make_model( ResolutionModelKind::Linear, { 0.05, -0.01 } );
  BOOST_CHECK_EQUAL( neg.predict( 10.0 ), 0.0 );

  // the detector equivalent reproduces the family at 6 keV with the default ε
  const DetectorParameters d = lin.detector_equivalent();
  BOOST_CHECK_EQUAL( d.epsilon, DetectorParameters().epsilon );
  BOOST_CHECK_CLOSE( std::sqrt( d.fwhm_0*d.fwhm_0 + 2.355*2.355*d.epsilon*6.0 ), 0.12, 1.0e-6 );
}


BOOST_AUTO_TEST_CASE( JsonDocuments )
{
  ResolutionModel m = make_model( ResolutionModelKind::Quadratic, { 0.085, 0.004, 0.00005 }, -120.5, -117.0 );
  m.param_errors << 0.001, 0.0002, 0.00001;
  m.r_squared  = 0.987;
  m.rmse       = 0.0021;
  m.n_peaks    = 14;
  m.energy_min = 1.25;
  m.energy_max = 17.7;
  m.calibration_date = "2024-03-01T14:05:09";

  const nlohmann::json j = m;
  BOOST_CHECK_EQUAL( j["model_type"].get<std::string>(), "quadratic" );
  BOOST_CHECK_EQUAL( j["parameters"]["linear_coef"].get<double>(), 0.004 );
  BOOST_CHECK_EQUAL( j["energy_range"].size(), 2u );

  const ResolutionModel back = j.get<ResolutionModel>();
  BOOST_CHECK( back.kind == ResolutionModelKind::Quadratic );
  BOOST_CHECK_EQUAL( back.params[2], 0.00005 );
  BOOST_CHECK_EQUAL( back.param_errors[1], 0.0002 );
  BOOST_CHECK_EQUAL( back.n_peaks, 14 );
  BOOST_CHECK_EQUAL( back.energy_max, 17.7 );
  BOOST_CHECK_EQUAL( back.aic, -120.5 );
  BOOST_CHECK_EQUAL( back.calibration_date, m.calibration_date );

  nlohmann::json missing = j;
  missing["parameters"].erase( "intercept" );
  BOOST_CHECK_THROW( missing.get<ResolutionModel>(), ConfigurationError );

  const nlohmann::json unknown = { {"resolution", 0.1} };
  BOOST_CHECK_THROW( unknown.get<ResolutionModel>(), ConfigurationError );
}


BOOST_AUTO_TEST_CASE( LegacyDetectorDocuments )
{
  const nlohmann::json ev = { {"fwhm_0_eV", 92.0}, {"epsilon_eV_per_keV", 0.35},
                              {"fwhm_0_error_eV", 1.5}, {"r_squared", 0.99}, {"rmse_eV", 2.0} };
  const ResolutionModel a = ev.get<ResolutionModel>();
  BOOST_CHECK( a.kind == ResolutionModelKind::Detector );
  BOOST_CHECK_CLOSE( a.params[0], 0.092, 1.0e-9 );
  BOOST_CHECK_CLOSE( a.params[1], 0.00035, 1.0e-9 );
  BOOST_CHECK_CLOSE( a.param_errors[0], 0.0015, 1.0e-9 );
  BOOST_CHECK_CLOSE( a.rmse, 0.002, 1.0e-9 );

  const nlohmann::json kev = { {"fwhm_0_keV", 0.1}, {"epsilon_keV", 0.0005} };
  const ResolutionModel b = kev.get<ResolutionModel>();
  BOOST_CHECK_EQUAL( b.params[0], 0.1 );
  BOOST_CHECK_EQUAL( b.params[1], 0.0005 );

  // ε defaults to the typical drift detector value
  const nlohmann::json bare = { {"fwhm_0_eV", 100.0} };
  BOOST_CHECK_CLOSE( bare.get<ResolutionModel>().params[1], DetectorParameters().epsilon, 1.0e-9 );
}


BOOST_AUTO_TEST_CASE( ModelFiles )
{
  const std::string path = (std::filesystem::temp_directory_path() / "xrfcal_test_resolution.json").string();
  const ResolutionModel m = make_model( ResolutionModelKind::Power, { 0.07, 0.25 } );
  save_resolution_model( m, path );

  const ResolutionModel back = load_resolution_model( path );
  BOOST_CHECK( back.kind == ResolutionModelKind::Power );
  BOOST_CHECK_CLOSE( back.predict( 9.0 ), m.predict( 9.0 ), 1.0e-9 );

  save_json( { {"model_type", "linear"}, {"parameters", {{"intercept", "wide"}, {"slope", 0.1}}} }, path );
  BOOST_CHECK_THROW( load_resolution_model( path ), ConfigurationError );

  std::filesystem::remove( path );
  BOOST_CHECK_THROW( load_resolution_model( path ), ConfigurationError );
}


BOOST_AUTO_TEST_CASE( RankingByInformationCriteria )
{
  std::vector<ResolutionModel> models = {
    make_model( ResolutionModelKind::Linear,      { 0.1, 0.005 },       -50.0, -48.0 ),
    make_model( ResolutionModelKind::Detector,    { 0.08, 0.0004 },     -60.0, -57.0 ),
    make_model( ResolutionModelKind::Quadratic,   { 0.1, 0.004, 0.0 },  -60.0, -58.0 ),
    make_model( ResolutionModelKind::Exponential, { 0.1, 0.02 },        -60.0, -57.0 )
  };

  const std::vector<ResolutionModel> ranked = rank_models( models );
  BOOST_REQUIRE_EQUAL( ranked.size(), 4u );
  BOOST_CHECK( ranked[0].kind == ResolutionModelKind::Quadratic );      // AIC tie, lower BIC
  BOOST_CHECK( ranked[1].kind == ResolutionModelKind::Detector );       // full tie keeps input order
  BOOST_CHECK( ranked[2].kind == ResolutionModelKind::Exponential );
  BOOST_CHECK( ranked[3].kind == ResolutionModelKind::Linear );
}
