#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <loguru.hpp>

/** Only warnings and errors on stderr while testing. */
int main(int argc, char** argv) {
	try {
		loguru::g_stderr_verbosity = loguru::Verbosity_WARNING;
		return Catch::Session().run(argc, argv);
	}
	catch (const std::exception& ex) {
		return -1;
	}
}
