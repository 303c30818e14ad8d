#pragma once

struct Candidate;

double stop_buffer(const Candidate& candidate, double point);

// Strictly beyond the candidate's invalidation edge
double place_stop(const Candidate& candidate, double point);
