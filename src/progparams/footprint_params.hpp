#ifndef FOOTPRINTGIS_PROGPARAMS_FOOTPRINT_PARAMS_HPP
#define FOOTPRINTGIS_PROGPARAMS_FOOTPRINT_PARAMS_HPP

#include <string>

#include <progparams/footprint_datastructs.hpp>

/* Parses the command line into the operator selected by --querytype.
 * Returns false (after printing the reason or the help text) when the
 * program should stop with a usage error. */
bool extract_params(int argc, char **argv, std::string &query_type,
	struct partition_op &partop, struct extract_op &exop);

#endif
