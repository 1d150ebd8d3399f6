// Text_Hex_Source.cpp

#include "Text_Hex_Source.h"

bool TextHexSource::rewind ()
  {
  if (openFails)
    return false;

  opens++;
  pos_ = 0;
  return true;
  }

bool TextHexSource::readLine (char * buffer, const unsigned int size, bool & lineTooLong)
  {
  lineTooLong = false;
  if (pos_ >= text.size ())
    return false;

  size_t end = text.find ('\n', pos_);
  if (end == std::string::npos)
    end = text.size ();

  std::string line = text.substr (pos_, end - pos_);
  pos_ = end + 1;

  if (!line.empty () && line [line.size () - 1] == '\r')
    line.erase (line.size () - 1);

  if (line.size () >= size)
    {
    lineTooLong = true;
    line.resize (size - 1);
    }

  line.copy (buffer, line.size ());
  buffer [line.size ()] = 0;
  return true;
  }
