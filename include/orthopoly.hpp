#ifndef __ORTHOPOLY_H_
#define __ORTHOPOLY_H_

#include "orthopoly/constants.hpp"
#include "orthopoly/special_functions.hpp"
#include "orthopoly/hypergeometric.hpp"
#include "orthopoly/recurrence.hpp"
#include "orthopoly/integer_degree.hpp"
#include "orthopoly/general_degree.hpp"

#endif
