#include "FpmCommand.h"

static const FpmCommandSpec COMMANDS[] = {
  {FpmCommand::GenImage, "GenImage", 0, 0, FpmResponseShape::AckOnly, FpmDataLimit::None},
  {FpmCommand::GenChar, "GenChar", 1, 0, FpmResponseShape::AckOnly, FpmDataLimit::None},
  {FpmCommand::Match, "Match", 0, 2, FpmResponseShape::AckOnly, FpmDataLimit::None},
  {FpmCommand::Search, "Search", 5, 4, FpmResponseShape::AckOnly, FpmDataLimit::None},
  {FpmCommand::RegModel, "RegModel", 0, 0, FpmResponseShape::AckOnly, FpmDataLimit::None},
  {FpmCommand::Store, "Store", 3, 0, FpmResponseShape::AckOnly, FpmDataLimit::None},
  {FpmCommand::LoadChar, "LoadChar", 3, 0, FpmResponseShape::AckOnly, FpmDataLimit::None},
  {FpmCommand::UpChar, "UpChar", 1, 0, FpmResponseShape::AckThenData, FpmDataLimit::Template},
  {FpmCommand::DownChar, "DownChar", 1, 0, FpmResponseShape::AckThenUpload, FpmDataLimit::Template},
  {FpmCommand::UpImage, "UpImage", 0, 0, FpmResponseShape::AckThenData, FpmDataLimit::Image},
  {FpmCommand::DownImage, "DownImage", 0, 0, FpmResponseShape::AckThenUpload, FpmDataLimit::Image},
  {FpmCommand::DeleteChar, "DeleteChar", 4, 0, FpmResponseShape::AckOnly, FpmDataLimit::None},
  {FpmCommand::Empty, "Empty", 0, 0, FpmResponseShape::AckOnly, FpmDataLimit::None},
  {FpmCommand::SetSysPara, "SetSysPara", 2, 0, FpmResponseShape::AckOnly, FpmDataLimit::None},
  {FpmCommand::ReadSysPara, "ReadSysPara", 0, 16, FpmResponseShape::AckOnly, FpmDataLimit::None},
  {FpmCommand::SetPwd, "SetPwd", 4, 0, FpmResponseShape::AckOnly, FpmDataLimit::None},
  {FpmCommand::VfyPwd, "VfyPwd", 4, 0, FpmResponseShape::AckOnly, FpmDataLimit::None},
  {FpmCommand::SetAddr, "SetAddr", 4, 0, FpmResponseShape::AckOnly, FpmDataLimit::None},
  {FpmCommand::HiSpeedSearch, "HiSpeedSearch", 5, 4, FpmResponseShape::AckOnly, FpmDataLimit::None},
  {FpmCommand::TemplateCount, "TemplateCount", 0, 2, FpmResponseShape::AckOnly, FpmDataLimit::None},
};

static const FpmCommandSpec UNKNOWN_COMMAND = {
  FpmCommand::GenImage, "Unknown", 0, 0, FpmResponseShape::AckOnly, FpmDataLimit::None
};

const FpmCommandSpec* fpmCommandSpec(FpmCommand command) {
  for (size_t i = 0; i < sizeof(COMMANDS) / sizeof(COMMANDS[0]); i++) {
    if (COMMANDS[i].command == command) {
      return &COMMANDS[i];
    }
  }
  return &UNKNOWN_COMMAND;
}

const char* fpmCommandName(FpmCommand command) {
  return fpmCommandSpec(command)->name;
}
