#pragma once

// kyotee_cli validate <spec.json>
int cmd_validate(int argc, char** argv);

// kyotee_cli check <schema.json> <doc>
int cmd_check(int argc, char** argv);
