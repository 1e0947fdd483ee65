#pragma once
#include <vector>
#include "Card.hpp"
#include "Date.hpp"

/*
  Returns copies of the cards whose next_review <= asOf, ordered by
  next_review ascending and then by id, so an unchanged card set always
  yields the same queue. Does not touch the input.
*/
std::vector<Card> buildDueQueue(const std::vector<Card>& cards, const Date& asOf);
