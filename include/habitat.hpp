#ifndef HABITAT_HPP
#define HABITAT_HPP

#include "habitat/environment.hpp"
#include "habitat/log.hpp"

#endif // HABITAT_HPP
