#pragma once

#include "core/Error.hpp"
#include "path/FilePath.hpp"
#include "fs/FileSystem.hpp"
#include "fs/LocalFileSystem.hpp"
#include "fs/RandomSource.hpp"
#include "fs/FileOps.hpp"
