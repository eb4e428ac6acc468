#pragma once

#include "kitties/kitties.hpp"
