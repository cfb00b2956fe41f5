#include "prompt.hpp"

#include <cstdio>
#include <cstdlib>

#include <readline/history.h>
#include <readline/readline.h>

#include "settings_manager.hpp"

bool ReadlineConfirmer::confirm(const std::string& question) {
  std::string prompt = question + " Type 'yes' to continue: ";
  char* line = readline(prompt.c_str());
  if(!line) return false;
  std::string answer(line);
  free(line);
  return SettingsManager::to_lower(SettingsManager::trim_copy(answer)) == "yes";
}
