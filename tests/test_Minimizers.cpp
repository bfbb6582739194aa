#define BOOST_TEST_MODULE Minimizers_suite

#include <cmath>
#include <limits>
#include <vector>

#include <boost/test/included/unit_test.hpp>

#include "xrfcal/BoundedMinimizer.hpp"
#include "xrfcal/CurveFit.hpp"
#include "xrfcal/Errors.hpp"
#include "xrfcal/Powell.hpp"
#include "xrfcal/SimpleLM.hpp"

using namespace xrfcal;

namespace
{
  Vector vec2( const double a, const double b )
  {
    Vector v( 2 );
    v << a, b;
    return v;
  }

  // minimum at (3, -1), outside the box used below on the first axis
  double shifted_quadratic( const Vector &x )
  {
    return (x[0] - 3.0)*(x[0] - 3.0) + 4.0*(x[1] + 1.0)*(x[1] + 1.0);
  }

  double rosenbrock( const Vector &x )
  {
    const double a = 1.0 - x[0];
    const double b = x[1] - x[0]*x[0];
    return a*a + 100.0*b*b;
  }
}//namespace


BOOST_AUTO_TEST_CASE( MinimizerNames )
{
  BOOST_CHECK( parse_minimizer_kind("lbfgsb") == MinimizerKind::QuasiNewton );
  BOOST_CHECK( parse_minimizer_kind("L-BFGS-B") == MinimizerKind::QuasiNewton );
  BOOST_CHECK( parse_minimizer_kind("quasi-newton") == MinimizerKind::QuasiNewton );
  BOOST_CHECK( parse_minimizer_kind("Powell") == MinimizerKind::Powell );
  BOOST_CHECK_THROW( parse_minimizer_kind("nelder-mead"), ConfigurationError );

  BOOST_CHECK( make_minimizer( MinimizerKind::Powell )->kind() == MinimizerKind::Powell );
  BOOST_CHECK( make_minimizer( MinimizerKind::QuasiNewton )->kind() == MinimizerKind::QuasiNewton );
}


BOOST_AUTO_TEST_CASE( ActiveBoundIsRespected )
{
  const Vector lower = vec2( -2.0, -2.0 );
  const Vector upper = vec2(  2.0,  2.0 );

  for( const auto kind : { MinimizerKind::QuasiNewton, MinimizerKind::Powell } )
  {
    const MinimizerResult r = make_minimizer( kind )->minimize( shifted_quadratic, vec2( 0.0, 0.0 ),
                                                                lower, upper );
    BOOST_CHECK_MESSAGE( r.success, to_string(kind) << ": " << r.message );
    BOOST_CHECK_SMALL( r.x[0] - 2.0, 1.0e-4 );
    BOOST_CHECK_SMALL( r.x[1] + 1.0, 1.0e-3 );
    BOOST_CHECK_CLOSE( r.fun, 1.0, 0.1 );
    BOOST_CHECK( r.x[0] <= 2.0 );
    BOOST_CHECK( r.function_evals > 0 );
  }
}


BOOST_AUTO_TEST_CASE( RosenbrockValley )
{
  const Vector lower = vec2( -2.0, -1.0 );
  const Vector upper = vec2(  2.0,  3.0 );

  MinimizerOptions opt;
  opt.max_iterations = 2000;

  for( const auto kind : { MinimizerKind::QuasiNewton, MinimizerKind::Powell } )
  {
    const MinimizerResult r = make_minimizer( kind, opt )->minimize( rosenbrock, vec2( -1.2, 1.0 ),
                                                                     lower, upper );
    BOOST_CHECK_MESSAGE( r.fun < 1.0e-3, to_string(kind) << ": f = " << r.fun );
    BOOST_CHECK_SMALL( r.x[0] - 1.0, 0.05 );
    BOOST_CHECK_SMALL( r.x[1] - 1.0, 0.1 );
  }
}


BOOST_AUTO_TEST_CASE( CallbackCancels )
{
  const Vector lower = vec2( -2.0, -1.0 );
  const Vector upper = vec2(  2.0,  3.0 );

  for( const auto kind : { MinimizerKind::QuasiNewton, MinimizerKind::Powell } )
  {
    int calls = 0;
    const IterationCallback stop_after_two = [&calls]( int, const Vector &, double ){
      return ++calls < 2;
    };

    const MinimizerResult r = make_minimizer( kind )->minimize( rosenbrock, vec2( -1.2, 1.0 ),
                                                                lower, upper, stop_after_two );
    BOOST_CHECK( r.cancelled );
    BOOST_CHECK( !r.success );
    BOOST_CHECK_EQUAL( calls, 2 );
    BOOST_CHECK( r.fun <= rosenbrock( vec2( -1.2, 1.0 ) ) );
  }
}


BOOST_AUTO_TEST_CASE( InconsistentBoundsThrow )
{
  const auto qn = make_minimizer( MinimizerKind::QuasiNewton );
  BOOST_CHECK_THROW( qn->minimize( rosenbrock, vec2( 0.0, 0.0 ), vec2( 1.0, 0.0 ), vec2( 0.0, 1.0 ) ),
                     ConfigurationError );
  BOOST_CHECK_THROW( qn->minimize( rosenbrock, vec2( 0.0, 0.0 ), Vector::Zero(3), Vector::Ones(3) ),
                     ConfigurationError );
}


BOOST_AUTO_TEST_CASE( PowellTemplateDirect )
{
  Vector x = vec2( 1.5, 1.5 );
  const PowellSolverSummary summ = powell( shifted_quadratic, x, vec2( -5.0, -5.0 ), vec2( 5.0, 5.0 ) );

  BOOST_CHECK( summ.converged );
  BOOST_CHECK( summ.final_value < summ.initial_value );
  BOOST_CHECK_SMALL( x[0] - 3.0, 1.0e-4 );
  BOOST_CHECK_SMALL( x[1] + 1.0, 1.0e-4 );
}


BOOST_AUTO_TEST_CASE( CurveFitExponential )
{
  const int n = 50;
  Vector x( n ), y( n );
  for( int i = 0; i < n; ++i )
  {
    x[i] = 0.1*i;
    y[i] = 40.0*std::exp( -1.5*x[i] ) + 2.0;
  }

  const CurveModel model = []( const Vector &xx, const Vector &p ) -> Vector {
    return ( p[0]*( -p[1]*xx.array() ).exp() + p[2] ).matrix();
  };

  Vector p0( 3 );
  p0 << 10.0, 0.5, 0.0;

  const CurveFitResult free = curve_fit( model, x, y, p0, { 0.0, 0.0, -10.0 }, { 100.0, 10.0, 10.0 } );
  BOOST_REQUIRE( free.converged );
  BOOST_CHECK_CLOSE( free.params[0], 40.0, 0.01 );
  BOOST_CHECK_CLOSE( free.params[1], 1.5, 0.01 );
  BOOST_CHECK_SMALL( free.params[2] - 2.0, 1.0e-3 );
  BOOST_CHECK( !free.at_lower_bound[1] && !free.at_upper_bound[1] );
  BOOST_CHECK( free.chi2 < 1.0e-6 );

  // decay rate pinned to its upper bound
  const CurveFitResult capped = curve_fit( model, x, y, p0, { 0.0, 0.0, -10.0 }, { 100.0, 1.0, 10.0 } );
  BOOST_CHECK( capped.converged );
  BOOST_CHECK( capped.at_upper_bound[1] );
  BOOST_CHECK_CLOSE( capped.params[1], 1.0, 1.0e-6 );

  // offset frozen at its start value
  const CurveFitResult frozen = curve_fit( model, x, y, p0, {}, {}, Vector(), { true, true, false } );
  BOOST_CHECK_EQUAL( frozen.params[2], 0.0 );
  BOOST_CHECK_EQUAL( frozen.errors[2], 0.0 );

  BOOST_CHECK_THROW( curve_fit( model, x, y.head(10), p0, {}, {} ), ConfigurationError );

  const CurveModel broken = []( const Vector &xx, const Vector & ) -> Vector {
    return Vector::Constant( xx.size(), std::numeric_limits<double>::quiet_NaN() );
  };
  BOOST_CHECK_THROW( curve_fit( broken, x, y, p0, {}, {} ), FitDivergenceError );
}


BOOST_AUTO_TEST_CASE( CurveFitCenterPinnedAtBound )
{
  // the true line sits below the allowed center window
  const int n = 81;
  Vector x( n ), y( n );
  for( int i = 0; i < n; ++i )
  {
    x[i] = 1.0 + 0.01*i;
    const double dx = x[i] - 1.254;
    y[i] = 3000.0*std::exp( -0.5*dx*dx/(0.041*0.041) );
  }

  const CurveModel model = []( const Vector &xx, const Vector &p ) -> Vector {
    return ( p[0]*( -0.5*( xx.array() - p[1] ).square()/(p[2]*p[2]) ).exp() ).matrix();
  };

  Vector p0( 3 );
  p0 << 1000.0, 1.35, 0.06;
  const double chi2_start = ( model( x, p0 ) - y ).squaredNorm();

  const CurveFitResult fit = curve_fit( model, x, y, p0, { 100.0, 1.30, 0.02 }, { 6000.0, 1.60, 0.2 } );
  BOOST_CHECK( fit.converged );
  BOOST_CHECK( fit.at_lower_bound[1] );
  BOOST_CHECK_CLOSE( fit.params[1], 1.30, 1.0e-6 );
  BOOST_CHECK( fit.chi2 < chi2_start );
  BOOST_CHECK( fit.params.allFinite() );
}


BOOST_AUTO_TEST_CASE( NonFiniteObjectiveRegions )
{
  // NaN beyond x0 = 3.5, +inf below x1 = -1.5; the minimum (3, -1) lies in the finite part
  int bad_evaluations = 0;
  const Objective patchy = [&bad_evaluations]( const Vector &x ) {
    if( x[0] > 3.5 )
    {
      ++bad_evaluations;
      return std::numeric_limits<double>::quiet_NaN();
    }
    if( x[1] < -1.5 )
    {
      ++bad_evaluations;
      return std::numeric_limits<double>::infinity();
    }
    return shifted_quadratic( x );
  };

  const Vector lower = vec2( -2.0, -2.0 );
  const Vector upper = vec2(  4.0,  3.0 );

  for( const auto kind : { MinimizerKind::QuasiNewton, MinimizerKind::Powell } )
  {
    bad_evaluations = 0;
    const MinimizerResult r = make_minimizer( kind )->minimize( patchy, vec2( 0.0, 0.0 ), lower, upper );
    BOOST_CHECK_MESSAGE( std::isfinite( r.fun ), to_string(kind) << ": f = " << r.fun );
    BOOST_CHECK( r.x.allFinite() );
    BOOST_CHECK_SMALL( r.x[0] - 3.0, 1.0e-3 );
    BOOST_CHECK_SMALL( r.x[1] + 1.0, 1.0e-3 );
    BOOST_CHECK( r.fun < 1.0e-5 );

    // the line search along the first axis steps onto the upper bound
    if( kind == MinimizerKind::Powell )
      BOOST_CHECK( bad_evaluations > 0 );
  }

  const MinimizerResult nan_start = make_minimizer( MinimizerKind::QuasiNewton )
                                      ->minimize( patchy, vec2( 3.8, 0.0 ), lower, upper );
  BOOST_CHECK( !nan_start.success );
  BOOST_CHECK_EQUAL( nan_start.message, "objective is not finite at the starting point" );
}
