#ifndef FOOTPRINTGIS_UTILITIES_TOKENIZER_H
#define FOOTPRINTGIS_UTILITIES_TOKENIZER_H

#include <string>
#include <vector>

/* Splits str on any of the delimiter characters.
 * Text between quote characters is kept whole; inside a quoted section a
 * doubled quote stands for one literal quote (CSV escaping). */
void tokenize(const std::string &str, std::vector<std::string> &result,
	const std::string &delimiters = " ,;:\t",
	const bool keepBlankFields = false,
	const std::string &quote = "\"\'");

#endif
