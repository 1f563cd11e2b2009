#ifndef _ORTHOPOLY_CONSTANTS_HPP
#define _ORTHOPOLY_CONSTANTS_HPP

namespace OrthoPoly::Constants {
// Below this |x| the Legendre and Gegenbauer recurrences lose precision
#ifndef ORTHOPOLY_SMALL_ARGUMENT
#define ORTHOPOLY_SMALL_ARGUMENT 1.0e-5
#endif
#ifndef ORTHOPOLY_SERIES_CUTOFF
#define ORTHOPOLY_SERIES_CUTOFF 1.0e-20
#endif
#ifndef ORTHOPOLY_SMALL_GEGENBAUER_RATIO
#define ORTHOPOLY_SMALL_GEGENBAUER_RATIO 1.0e-8
#endif
#ifndef ORTHOPOLY_SERIES_MAX_TERMS
#define ORTHOPOLY_SERIES_MAX_TERMS 2000
#endif
#ifndef ORTHOPOLY_SERIES_TOLERANCE
#define ORTHOPOLY_SERIES_TOLERANCE 1.0e-15
#endif
#ifndef ORTHOPOLY_HYP2F1_RADIUS
#define ORTHOPOLY_HYP2F1_RADIUS 0.9
#endif
#ifndef ORTHOPOLY_TABLE_DEFAULT_DEGREE
#define ORTHOPOLY_TABLE_DEFAULT_DEGREE 5
#endif

constexpr double small_argument = ORTHOPOLY_SMALL_ARGUMENT;
// relative size of a power series term at which summation stops
constexpr double series_cutoff = ORTHOPOLY_SERIES_CUTOFF;
constexpr double small_gegenbauer_ratio = ORTHOPOLY_SMALL_GEGENBAUER_RATIO;
// complex hypergeometric series
constexpr int series_max_terms = ORTHOPOLY_SERIES_MAX_TERMS;
constexpr double series_tolerance = ORTHOPOLY_SERIES_TOLERANCE;
constexpr double hyp2f1_radius = ORTHOPOLY_HYP2F1_RADIUS;
constexpr long table_default_degree = ORTHOPOLY_TABLE_DEFAULT_DEGREE;
} // namespace OrthoPoly::Constants
#endif
