#pragma once

#include <numcsv/error.hpp>
#include <numcsv/logger.hpp>
#include <numcsv/matrix.hpp>
#include <numcsv/reader.hpp>
