#pragma once

namespace narrowpack::cli {

int run(int argc, char** argv);

} // namespace narrowpack::cli
