#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <contractdb/log.hpp>

int main(int argc, char* argv[])
{
   // Tests trigger TypeError and map replacement on purpose
   contractdb::loggers::configure(contractdb::loggers::level::warning);
   return Catch::Session().run(argc, argv);
}
