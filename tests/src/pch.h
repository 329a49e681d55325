#pragma once
#include "gtest/gtest.h"
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
