#include <utilities/tokenizer.h>

using namespace std;

void tokenize(const string &str, vector<string> &result,
	const string &delimiters, const bool keepBlankFields, const string &quote)
{
	result.clear();

	if (delimiters.empty())
		return;

	string::size_type pos = 0; // the current position (char) in the string
	string::size_type len = str.length();
	char ch = 0;
	char current_quote = 0; // the char of the current open quote
	bool quoted = false;
	string token;

	while (pos < len)
	{
		ch = str[pos];
		bool add_char = true;
		bool token_complete = false;

		if (!quote.empty() && string::npos != quote.find(ch))
		{
			if (!quoted)
			{
				quoted = true;
				current_quote = ch;
				add_char = false;
			}
			else if (current_quote == ch)
			{
				if (pos + 1 < len && str[pos + 1] == ch)
				{
					// doubled quote: keep one, skip the other
					pos++;
				}
				else
				{
					quoted = false;
					current_quote = 0;
					add_char = false;
				}
			}
		}

		if (!quoted && add_char && string::npos != delimiters.find(ch))
		{
			token_complete = true;
			add_char = false;
		}

		if (add_char)
			token.push_back(ch);

		if (token_complete)
		{
			if (!token.empty() || keepBlankFields)
				result.push_back(token);
			token.clear();
		}
		++pos;
	}

	// the final token
	if (!token.empty()) {
		result.push_back(token);
	}
	else if (keepBlankFields && len > 0) {
		result.push_back("");
	}
}
