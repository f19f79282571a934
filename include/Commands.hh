#pragma once

namespace tuslice {
class CommandParamList;

int export_program(CommandParamList const&);
int list_functions(CommandParamList const&);
int show_closure(CommandParamList const&);
}  // namespace tuslice
